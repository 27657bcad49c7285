/**
 * @file   transfer_set.cpp
 * @brief  Implements TransferSet.
 *
 * @date   2026-10-19
 */

#include "transfer_set.hpp"

#include <stdexcept>

namespace provider_bridge {

std::size_t TransferSet::add(ByteBuffer buffer) {
    if (!buffer)
        throw std::invalid_argument("TransferSet cannot hold a null buffer");

    const void* key = buffer.get();
    auto it = m_index.find(key);
    if (it != m_index.end())
        return it->second;

    const std::size_t idx = m_buffers.size();
    m_buffers.push_back(std::move(buffer));
    m_index.emplace(key, idx);
    return idx;
}

bool TransferSet::contains(const ByteBuffer& buffer) const noexcept {
    return buffer && m_index.find(buffer.get()) != m_index.end();
}

std::size_t TransferSet::totalBytes() const noexcept {
    std::size_t total = 0;
    for (auto const& b : m_buffers)
        total += b->size();
    return total;
}

std::vector<ByteBuffer> TransferSet::release() noexcept {
    std::vector<ByteBuffer> out;
    out.swap(m_buffers);
    m_index.clear();
    return out;
}

} // namespace provider_bridge
