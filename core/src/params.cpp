#include "params.hpp"
#include <stdexcept>

ParamList params_range(long long first, long long last) {
    if (last < first)
        throw std::invalid_argument("params_range: last < first");
    ParamList out;
    out.reserve(static_cast<size_t>(last - first));
    for (long long v = first; v < last; ++v)
        out.emplace_back(v);
    return out;
}

Key key_from_text(const std::string& text) {
    return Key(text.begin(), text.end());
}
