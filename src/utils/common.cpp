#include "utils/common.hpp"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "errors.hpp"

namespace runbox::utils {

std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

std::string Trim(const std::string& value) {
    static const char* kWhitespace = " \t\r\n\f\v";
    const auto begin = value.find_first_not_of(kWhitespace);
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(kWhitespace);
    return value.substr(begin, end - begin + 1);
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = Trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::vector<std::filesystem::directory_entry> ReadDirectory(const std::filesystem::path& directory) {
    std::vector<std::filesystem::directory_entry> entries;
    std::error_code ec;
    std::filesystem::directory_iterator it(directory, ec);
    const std::filesystem::directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        throw StorageError("cannot read directory " + directory.string() + ": " + ec.message());
    }
    return entries;
}

std::string ToIsoString(std::chrono::system_clock::time_point time) {
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(time);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(time - seconds).count();
    const auto raw = std::chrono::system_clock::to_time_t(seconds);
    std::tm local_time{};
#if defined(_WIN32)
    localtime_s(&local_time, &raw);
#else
    localtime_r(&raw, &local_time);
#endif
    std::ostringstream oss;
    oss << std::put_time(&local_time, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros;
    return oss.str();
}

std::optional<std::chrono::milliseconds> ParseSeconds(const std::string& text) {
    double seconds = 0.0;
    try {
        std::size_t consumed = 0;
        seconds = std::stod(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    if (!std::isfinite(seconds) || seconds <= 0 || seconds > kMaxParsedSeconds) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

std::string FormatSeconds(std::chrono::milliseconds duration) {
    const auto millis = duration.count();
    std::ostringstream oss;
    oss << millis / 1000;
    auto fraction = millis % 1000;
    if (fraction != 0) {
        std::string digits = std::to_string(fraction);
        digits.insert(0, 3 - digits.size(), '0');
        while (!digits.empty() && digits.back() == '0') {
            digits.pop_back();
        }
        oss << '.' << digits;
    }
    oss << 's';
    return oss.str();
}

}  // namespace runbox::utils
