#include "zfs/output_parser.hpp"

#include <charconv>
#include <cmath>
#include <limits>
#include <string>
#include <system_error>
#include <vector>

namespace zsend::zfs {

namespace {

[[nodiscard]] bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// Split on runs of blanks, the way awk does.
[[nodiscard]] std::vector<std::string_view> fields(std::string_view line) {
    std::vector<std::string_view> out;
    std::size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && is_space(line[i])) ++i;
        const std::size_t start = i;
        while (i < line.size() && !is_space(line[i])) ++i;
        if (i > start) {
            out.push_back(line.substr(start, i - start));
        }
    }
    return out;
}

// Calls fn(line) for every line of `raw` (without the terminator).
template <typename Fn>
void for_each_line(std::string_view raw, Fn&& fn) {
    while (!raw.empty()) {
        const auto nl = raw.find('\n');
        fn(raw.substr(0, nl));
        if (nl == std::string_view::npos) break;
        raw.remove_prefix(nl + 1);
    }
}

// SI / IEC multiplier for a unit suffix (without the optional trailing 'B').
[[nodiscard]] std::optional<double> unit_multiplier(std::string_view unit) {
    if (unit.empty()) return 1.0;

    static constexpr std::string_view kPrefixes = "KMGTPE";
    const char p = (unit[0] == 'k') ? 'K' : unit[0];
    const auto idx = kPrefixes.find(p);
    if (idx == std::string_view::npos) return std::nullopt;

    const int power = static_cast<int>(idx) + 1;
    if (unit.size() == 1) {
        return std::pow(1000.0, power);
    }
    if (unit.size() == 2 && unit[1] == 'i') {
        return std::pow(1024.0, power);
    }
    return std::nullopt;
}

} // anonymous namespace

SnapshotChain parse_snapshot_names(std::string_view raw, std::string_view dataset) {
    SnapshotChain names;
    for_each_line(raw, [&](std::string_view line) {
        const auto f = fields(line);
        if (f.empty()) return;

        const auto ref = split_snapshot_ref(f.front());
        if (!ref || ref->first != dataset || ref->second.empty()) return;
        names.push_back(ref->second);
    });
    return names;
}

std::optional<uint64_t> parse_estimated_size(std::string_view raw) {
    std::optional<std::string_view> size_field;
    std::vector<std::string_view>   last_fields;

    for_each_line(raw, [&](std::string_view line) {
        auto f = fields(line);
        if (f.empty()) return;
        if (f.size() >= 2 && f[0] == "size") {
            size_field = f[1];
        }
        last_fields = std::move(f);
    });

    if (size_field) {
        return parse_size_value(*size_field);
    }
    if (last_fields.size() >= 2) {
        if (auto v = parse_size_value(last_fields[1])) return v;
        return parse_size_value(last_fields.back());
    }
    return std::nullopt;
}

std::optional<uint64_t> parse_size_value(std::string_view value) {
    if (value.empty()) return std::nullopt;

    // Integer fast path: the -P form is always plain bytes.
    uint64_t whole = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), whole);
    if (ec == std::errc{} && ptr == value.data() + value.size()) {
        return whole;
    }

    double number = 0.0;
    auto [dptr, dec] = std::from_chars(value.data(), value.data() + value.size(), number);
    if (dec != std::errc{} || number < 0.0 || !std::isfinite(number)) {
        return std::nullopt;
    }

    std::string_view unit{dptr, static_cast<std::size_t>(value.data() + value.size() - dptr)};
    if (!unit.empty() && unit.back() == 'B') {
        unit.remove_suffix(1);
    }
    const auto mult = unit_multiplier(unit);
    if (!mult) return std::nullopt;

    const double bytes = std::ceil(number * *mult);
    if (bytes >= static_cast<double>(std::numeric_limits<uint64_t>::max())) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(bytes);
}

} // namespace zsend::zfs
