#include "keytree/derivation_path.hpp"

#include <sstream>

/**
 * @file derivation_path.cpp
 * @brief Implementation of DerivationPath parsing and printing.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    DerivationPath DerivationPath::parse(const std::string& path) {
        std::vector<std::string> tokens;
        std::string::size_type start = 0;

        // Split on '/' keeping empty tokens, so "m/" and "m//1" are rejected below.
        while (true) {
            std::string::size_type slash = path.find('/', start);
            if (slash == std::string::npos) {
                tokens.push_back(path.substr(start));
                break;
            }
            tokens.push_back(path.substr(start, slash - start));
            start = slash + 1;
        }

        if (tokens.front() != "m") {
            throw DecodeException("derivation path must start with 'm': " + path);
        }

        std::vector<ChildIndex> indices;
        indices.reserve(tokens.size() - 1);

        for (std::size_t i = 1; i < tokens.size(); ++i) {
            try {
                indices.push_back(ChildIndex::parse(tokens[i]));
            } catch (const DecodeException&) {
                throw DecodeException("invalid derivation path: " + path);
            }
        }

        return DerivationPath(std::move(indices));
    }

    std::string DerivationPath::toString() const {
        std::ostringstream oss;
        oss << 'm';
        for (const auto& child : path_) {
            oss << '/' << child.toString();
        }
        return oss.str();
    }

} // namespace Keytree
