// SPDX-FileCopyrightText: 2026 Contributors to the redlog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file AppendList.hpp
 * @brief Persistent append-only sequence with structural sharing
 *
 * Loggers accumulate name segments and fields as they are derived from one
 * another. Every derivation must leave the source logger untouched, so the
 * storage behind both sequences is a chain of immutable, reference-counted
 * nodes:
 *
 *   base    : [a] <- [b]
 *   derived : [a] <- [b] <- [c]      (shares a and b with base)
 *
 * - append() is O(1) and never modifies an existing node
 * - copies are O(1) (one shared_ptr copy)
 * - nodes are immutable once published, so lists can be read from any
 *   thread without synchronization
 */

#pragma once

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace redlog
{
    template<typename T>
    class AppendList
    {
    public:
        AppendList() = default;

        /**
         * Return a new list holding this list's items followed by value.
         * This list is left unchanged.
         */
        [[nodiscard]]
        AppendList append(T value) const
        {
            auto const size = this->size() + 1U;
            return AppendList{std::make_shared<Node const>(Node{std::move(value), _tail, size})};
        }

        [[nodiscard]]
        std::size_t size() const noexcept
        {
            return _tail ? _tail->size : 0U;
        }

        [[nodiscard]]
        bool empty() const noexcept
        {
            return !_tail;
        }

        /** The last appended item. Must not be called on an empty list. */
        [[nodiscard]]
        T const& back() const noexcept
        {
            return _tail->value;
        }

        /** Copy the items into a vector, in append order. */
        [[nodiscard]]
        std::vector<T> toVector() const
        {
            auto nodes = std::vector<Node const*>{};
            nodes.reserve(size());
            for (auto node = _tail.get(); node != nullptr; node = node->previous.get())
            {
                nodes.push_back(node);
            }

            auto result = std::vector<T>{};
            result.reserve(nodes.size());
            for (auto it = nodes.rbegin(); it != nodes.rend(); ++it)
            {
                result.push_back((*it)->value);
            }
            return result;
        }

        [[nodiscard]]
        bool operator==(AppendList const& other) const
        {
            if (size() != other.size())
            {
                return false;
            }

            auto lhs = _tail.get();
            auto rhs = other._tail.get();
            // Stop as soon as both chains reach a shared node.
            while ((lhs != rhs) && (lhs != nullptr))
            {
                if (!(lhs->value == rhs->value))
                {
                    return false;
                }
                lhs = lhs->previous.get();
                rhs = rhs->previous.get();
            }
            return true;
        }

        [[nodiscard]]
        bool operator!=(AppendList const& other) const
        {
            return !(*this == other);
        }

    private:
        struct Node
        {
            T value;
            std::shared_ptr<Node const> previous;
            std::size_t size;
        };

        explicit AppendList(std::shared_ptr<Node const> tail)
            : _tail{std::move(tail)}
        {}

        std::shared_ptr<Node const> _tail;
    };
}
