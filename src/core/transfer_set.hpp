/**
 * @file   transfer_set.hpp
 * @brief  Declares TransferSet: the identity-deduplicated list of physical
 *         buffers handed to the channel with one reply.
 *
 * @date   2026-10-19
 */

#ifndef PROVIDER_BRIDGE_TRANSFER_SET_HPP
#define PROVIDER_BRIDGE_TRANSFER_SET_HPP

#include <cstddef>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace provider_bridge {

/**
 * @class TransferSet
 * @brief Buffers in first-seen order, each physical buffer exactly once.
 *
 * Buffers are moved in; a buffer already present is identified by pointer
 * and its extra reference is dropped.
 */
class TransferSet {
public:
    /**
     * @brief Add a buffer, consuming the reference.
     * @return Index of the buffer inside the set.
     * @throws std::invalid_argument for a null buffer.
     */
    std::size_t add(ByteBuffer buffer);

    /** @return True if this physical buffer is already in the set. */
    bool contains(const ByteBuffer& buffer) const noexcept;

    std::size_t size() const noexcept { return m_buffers.size(); }
    bool empty() const noexcept { return m_buffers.empty(); }

    /** @return Total bytes across the distinct buffers. */
    std::size_t totalBytes() const noexcept;

    /**
     * @brief Hand the buffers over; the set is empty afterwards.
     */
    std::vector<ByteBuffer> release() noexcept;

private:
    std::vector<ByteBuffer>                        m_buffers;
    std::unordered_map<const void*, std::size_t>   m_index;  // buffer identity → position
};

} // namespace provider_bridge

#endif // PROVIDER_BRIDGE_TRANSFER_SET_HPP
