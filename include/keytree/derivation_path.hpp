#ifndef KEYTREE_DERIVATION_PATH_HPP
#define KEYTREE_DERIVATION_PATH_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "child_index.hpp"
#include "exceptions.hpp"

/**
 * @file derivation_path.hpp
 * @brief Ordered list of child indices, e.g. m/44'/0'/0'/0/0.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    /**
     * @class DerivationPath
     * @brief Immutable BIP-32 derivation path.
     */
    class DerivationPath {
    public:
        using const_iterator = std::vector<ChildIndex>::const_iterator;

        /// The empty path "m".
        DerivationPath() = default;

        explicit DerivationPath(std::vector<ChildIndex> path) : path_(std::move(path)) {}

        /**
         * @brief Parses a BIP-32/BIP-44 path string.
         * * Example path: "m/44'/0'/0'/0/0"
         * * The leading "m" is mandatory; no partial path is ever returned.
         * @throw DecodeException If the path format is incorrect.
         */
        static DerivationPath parse(const std::string& path);

        /// Canonical text form, e.g. "m/0'/1".
        std::string toString() const;

        std::size_t size() const { return path_.size(); }
        bool empty() const { return path_.empty(); }

        const ChildIndex& operator[](std::size_t i) const { return path_[i]; }

        const_iterator begin() const { return path_.begin(); }
        const_iterator end() const { return path_.end(); }

        const std::vector<ChildIndex>& indices() const { return path_; }

        bool operator==(const DerivationPath& other) const { return path_ == other.path_; }
        bool operator!=(const DerivationPath& other) const { return path_ != other.path_; }

    private:
        std::vector<ChildIndex> path_;
    };

} // namespace Keytree

#endif // KEYTREE_DERIVATION_PATH_HPP
