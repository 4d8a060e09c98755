/**
 * @file issue_index.hpp
 */
#pragma once
#include "issueforest/common/common.hpp"
#include "issueforest/common/forest_enums.hpp"

namespace issueforest
{

/**
 * @brief A list of unique issue IDs with insertion-order preservation.
 *
 * @details
 * `IssueIndex` assigns each distinct issue ID a dense `NodeIdx`, starting at 0
 * and following the order in which IDs are first inserted. The forest arena is
 * laid out in the same order, so the index doubles as the ID -> node lookup.
 * Internally, it combines a `std::vector` (for ordered storage) with a
 * `std::unordered_map` (for ID-to-index mapping).
 *
 * @par Duplicate handling
 * - `insert()` returns the existing index if the ID is already present.
 * - Duplicate insertions do not modify the list or change insertion order.
 *
 * @par Index semantics
 * - `npos` (value: `SIZE_MAX`) represents "not found" in `find()` results.
 * - For all `i` in `[0, size())`: `find(at(i)) == i`.
 *
 * @par Thread safety
 * - No internal synchronization; not thread-safe.
 * - Concurrent reads (const operations) are safe.
 */
class IssueIndex
{
public:
    /**
     * @brief Sentinel value indicating "not found" (equal to `SIZE_MAX`).
     */
    static constexpr NodeIdx npos = ~static_cast<NodeIdx>(0);

public:
    /**
     * @brief Insert an issue ID if not already present.
     * @return The index of the ID: new index if inserted, existing index if duplicate.
     * @throw std::invalid_argument if `id` is empty.
     * @note Strong exception guarantee: if this function throws, the list is unchanged.
     */
    NodeIdx insert(const std::string& id)
    {
        if (id.empty())
        {
            throw std::invalid_argument("IssueIndex::insert: empty issue ID");
        }
        auto it = m_map.find(id);
        if (it != m_map.end())
        {
            return it->second;
        }
        NodeIdx index = m_list.size();
        m_list.push_back(id);
        try
        {
            m_map.emplace(id, index);
        }
        catch (...)
        {
            m_list.pop_back();
            throw;
        }
        return index;
    }

    /**
     * @brief Find the index of the given issue ID.
     * @return The index if found; otherwise, `npos`.
     */
    NodeIdx find(const std::string& id) const noexcept
    {
        auto it = m_map.find(id);
        if (it != m_map.end())
        {
            return it->second;
        }
        return npos;
    }

    bool contains(const std::string& id) const noexcept
    {
        return find(id) != npos;
    }

    /**
     * @brief Access the issue ID at the given index.
     * @throw std::out_of_range if `index >= size()`.
     */
    const std::string& at(NodeIdx index) const
    {
        if (index >= m_list.size())
        {
            throw std::out_of_range("IssueIndex::at: index out of range");
        }
        return m_list[index];
    }

    size_t size() const noexcept
    {
        return m_list.size();
    }

    /**
     * @brief Enumerate all IDs in insertion order.
     * @tparam Func A callable type with signature `void(NodeIdx, const std::string&)`.
     * @warning Do not modify the index from inside the callback; behavior is undefined.
     */
    template <typename Func>
    void enumerate(Func&& func) const
    {
        static_assert(std::is_invocable_v<Func&, NodeIdx, const std::string&>,
            "Func must be callable as f(NodeIdx, const std::string&)");
        const size_t count = m_list.size();
        for (NodeIdx idx = 0u; idx < count; ++idx)
        {
            func(idx, m_list[idx]);
        }
    }

private:
    std::vector<std::string> m_list;
    std::unordered_map<std::string, NodeIdx> m_map;
};

} // namespace issueforest
