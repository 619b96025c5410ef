#include "geodna/geodna.hpp"

#include <spdlog/spdlog.h>

#include <unordered_set>

namespace geodna {

static const char SIBLING_SUFFIXES[] = {'a', 't', 'g', 'c'};

// One merge pass. `codes` holds no duplicates.
static std::vector<std::string> _reduce_pass(const std::vector<std::string> &codes) {
    std::unordered_set<std::string> present(codes.begin(), codes.end());

    std::vector<std::string> reduced;
    reduced.reserve(codes.size());
    for (const std::string &code : codes) {
        if (present.find(code) == present.end()) {
            continue;
        }
        if (code.size() < 2) {
            reduced.push_back(code);
            continue;
        }

        std::string prefix = parent(code);
        bool complete = true;
        for (const char &c : SIBLING_SUFFIXES) {
            if (present.find(prefix + c) == present.end()) {
                complete = false;
                break;
            }
        }

        if (complete) {
            for (const char &c : SIBLING_SUFFIXES) {
                present.erase(prefix + c);
            }
            reduced.push_back(prefix);
        } else {
            reduced.push_back(code);
        }
    }
    return reduced;
}

static std::vector<std::string> _unique(const std::vector<std::string> &codes) {
    std::unordered_set<std::string> seen;
    std::vector<std::string> unique;
    unique.reserve(codes.size());
    for (const std::string &code : codes) {
        if (seen.insert(code).second) {
            unique.push_back(code);
        }
    }
    return unique;
}

std::vector<std::string> reduce(const std::vector<std::string> &codes) {
    std::vector<std::string> current = _unique(codes);
    int pass = 0;
    while (true) {
        std::vector<std::string> reduced = _reduce_pass(current);
        ++pass;
        spdlog::debug("geodna reduce pass {}: {} -> {} codes", pass, current.size(), reduced.size());
        if (reduced.size() == current.size()) {
            return reduced;
        }
        // A merged parent may already have been in the list.
        current = _unique(reduced);
    }
}

} // namespace geodna
