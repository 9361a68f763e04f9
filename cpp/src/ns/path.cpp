#include "vb9/ns/path.hpp"

namespace vb9::ns {
    std::string normalize_path(std::string_view path) {
        std::string out;
        out.reserve(path.size() + 1);
        out.push_back('/');
        for (char c : path) {
            if (c == '/' && out.back() == '/') {
                continue;
            }
            out.push_back(c);
        }
        if (out.size() > 1 && out.back() == '/') {
            out.pop_back();
        }
        return out;
    }

    std::string join_path(std::string_view dir, std::string_view name) {
        std::string joined(dir);
        joined.push_back('/');
        joined.append(name);
        return normalize_path(joined);
    }
} // namespace vb9::ns
