/*
 * bulkget/src/transfer/transfer_common.cpp
 *
 * Small shared helpers: object location parsing, retry backoff schedule,
 * digest comparison, cancellable sleep and human-readable formatting.
 */

#include <bulkget/transfer/engine.hpp>
#include <bulkget/transfer/transfer.hpp>

#include <fmt/format.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/null_sink.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

namespace bulkget::transfer {

namespace {

constexpr std::string_view kS3Scheme = "s3://";
constexpr std::string_view kHttpsScheme = "https://";
constexpr std::string_view kAwsSuffix = "amazonaws.com";

inline char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

} // namespace

LoggerPtr nullLogger() {
    return std::make_shared<spdlog::logger>("bulkget-null",
                                            std::make_shared<spdlog::sinks::null_sink_mt>());
}

std::string ObjectLocation::fileName() const {
    auto pos = key.find_last_of('/');
    if (pos == std::string::npos)
        return key;
    return key.substr(pos + 1);
}

std::optional<ObjectLocation> parseObjectLocation(std::string_view location) {
    if (location.starts_with(kS3Scheme)) {
        auto rest = location.substr(kS3Scheme.size());
        auto slash = rest.find('/');
        if (slash == std::string_view::npos || slash == 0 || slash + 1 >= rest.size())
            return std::nullopt;
        return ObjectLocation{std::string(rest.substr(0, slash)), std::string(rest.substr(slash + 1))};
    }

    if (location.starts_with(kHttpsScheme)) {
        // Virtual-host style: https://<bucket>.s3[.<region>].amazonaws.com/<key>
        auto rest = location.substr(kHttpsScheme.size());
        auto slash = rest.find('/');
        if (slash == std::string_view::npos || slash + 1 >= rest.size())
            return std::nullopt;
        auto host = rest.substr(0, slash);
        auto key = rest.substr(slash + 1);
        auto s3 = host.find(".s3.");
        if (s3 == std::string_view::npos || s3 == 0 || !host.ends_with(kAwsSuffix))
            return std::nullopt;
        return ObjectLocation{std::string(host.substr(0, s3)), std::string(key)};
    }

    return std::nullopt;
}

std::chrono::milliseconds RetryPolicy::backoffFor(int attempt) const {
    if (attempt < 1)
        attempt = 1;
    const double base = static_cast<double>(initialBackoff.count());
    const double scaled = base * std::pow(multiplier, attempt - 1);
    const double capped = std::min(scaled, static_cast<double>(maxBackoff.count()));
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(capped)};
}

bool digestsMatch(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size() || a.empty())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (lower(a[i]) != lower(b[i]))
            return false;
    }
    return true;
}

std::optional<HashAlgo> parseHashAlgo(std::string_view name) {
    std::string n;
    n.reserve(name.size());
    for (char c : name)
        n.push_back(lower(c));
    if (n == "md5")
        return HashAlgo::Md5;
    if (n == "sha256" || n == "sha-256")
        return HashAlgo::Sha256;
    if (n == "sha512" || n == "sha-512")
        return HashAlgo::Sha512;
    return std::nullopt;
}

const char* hashAlgoName(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Md5:
            return "md5";
        case HashAlgo::Sha256:
            return "sha256";
        case HashAlgo::Sha512:
            return "sha512";
    }
    return "unknown";
}

bool sleepUnlessCancelled(std::chrono::milliseconds duration, const ShouldCancel& shouldCancel) {
    using clock = std::chrono::steady_clock;
    constexpr auto kSlice = std::chrono::milliseconds{100};

    const auto deadline = clock::now() + duration;
    while (true) {
        if (shouldCancel && shouldCancel())
            return false;
        const auto now = clock::now();
        if (now >= deadline)
            return true;
        std::this_thread::sleep_for(
            std::min<clock::duration>(kSlice, deadline - now));
    }
}

std::string formatSpeed(std::uint64_t bytes, std::chrono::milliseconds elapsed) {
    if (elapsed.count() <= 0)
        return "N/A";
    const double mib = static_cast<double>(bytes) / 1024.0 / 1024.0;
    const double secs = static_cast<double>(elapsed.count()) / 1000.0;
    return fmt::format("{:.2f} MB/s", mib / secs);
}

std::string formatSeconds(std::chrono::milliseconds elapsed) {
    return fmt::format("{:.2f} s", static_cast<double>(elapsed.count()) / 1000.0);
}

} // namespace bulkget::transfer
