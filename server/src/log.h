#pragma once
#include <format>
#include <functional>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace walkplan {

using TextLogger = std::function<void(std::string_view)>;

inline TextLogger OstreamLogger(std::ostream& os) {
    return [&os](std::string_view msg) { os << msg << "\n"; };
}

inline TextLogger NullLogger() {
    return [](std::string_view) {};
}

// Prefixes every message with "[component] " before handing it to `inner`.
inline TextLogger ComponentLogger(TextLogger inner, std::string component) {
    return [inner = std::move(inner), component = std::move(component)](
               std::string_view msg
           ) { inner(std::format("[{}] {}", component, msg)); };
}

// Appends every message to `sink`. The sink must outlive the logger.
inline TextLogger CollectingLogger(std::vector<std::string>& sink) {
    return [&sink](std::string_view msg) { sink.emplace_back(msg); };
}

}  // namespace walkplan
