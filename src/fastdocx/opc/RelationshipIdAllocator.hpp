#pragma once

#include <atomic>
#include <cstdint>

namespace fastdocx {
namespace opc {

/**
 * @brief 为导入的页眉页脚部件分配关系ID
 *
 * 从1开始单调递增，与源包中的ID无关。
 */
class RelationshipIdAllocator {
public:
    explicit RelationshipIdAllocator(uint32_t first = 1) : next_(first) {}

    RelationshipIdAllocator(const RelationshipIdAllocator&) = delete;
    RelationshipIdAllocator& operator=(const RelationshipIdAllocator&) = delete;

    /**
     * @brief 取得下一个ID（先返回后递增）
     */
    uint32_t next() noexcept { return next_.fetch_add(1, std::memory_order_relaxed); }

private:
    std::atomic<uint32_t> next_;
};

}} // namespace fastdocx::opc
