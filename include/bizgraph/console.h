#pragma once
// ═══════════════════════════════════════════════════════════════════
//  bizgraph/console.h - Leveled console logging
// ═══════════════════════════════════════════════════════════════════
//
//  console::info("store hydrated:", nodes, "businesses");
//  console::setLevel(console::Level::Warn);
//
//  Lines look like "12:04:31.207 WARN  cache put refused: ...".
//  Warn and Error go to the error sink, everything else to the
//  output sink.
//
// ═══════════════════════════════════════════════════════════════════

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <nlohmann/json.hpp>

namespace bizgraph::console {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Silent = 4 };

inline Level parseLevel(std::string_view name, Level fallback = Level::Info) {
    static constexpr std::pair<std::string_view, Level> names[] = {
        {"debug", Level::Debug}, {"info", Level::Info}, {"warn", Level::Warn},
        {"error", Level::Error}, {"silent", Level::Silent},
    };
    for (const auto& [text, lvl] : names) {
        if (text == name) return lvl;
    }
    return fallback;
}

namespace detail {

// How a line is tagged; `ok` is an Info line shown in green.
struct Tag {
    Level level;
    const char* label;
    const char* ansi;
};

inline constexpr Tag kPlain{Level::Info, "", "\033[0m"};
inline constexpr Tag kDebug{Level::Debug, "DEBUG", "\033[36m"};
inline constexpr Tag kInfo{Level::Info, "INFO ", "\033[34m"};
inline constexpr Tag kOk{Level::Info, "OK   ", "\033[32m"};
inline constexpr Tag kWarn{Level::Warn, "WARN ", "\033[33m"};
inline constexpr Tag kError{Level::Error, "ERROR", "\033[31m"};

class Sink {
public:
    static Sink& instance() {
        static Sink sink;
        return sink;
    }

    bool accepts(Level lvl) const {
        return static_cast<int>(lvl) >= threshold_.load(std::memory_order_relaxed);
    }

    void write(const Tag& tag, const std::string& body) {
        bool color = color_.load(std::memory_order_relaxed);
        std::string line = clock();
        if (*tag.label) {
            line += ' ';
            if (color) line += tag.ansi;
            line += tag.label;
            if (color) line += "\033[0m";
        }
        line += ' ';
        line += body;

        std::lock_guard<std::mutex> lock(mutex_);
        std::ostream& os = tag.level >= Level::Warn ? *err_ : *out_;
        os << line << '\n' << std::flush;
    }

    void redirect(std::ostream* out, std::ostream* err) {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = out ? out : &std::cout;
        err_ = err ? err : (out ? out : &std::cerr);
    }

    std::atomic<int> threshold_{static_cast<int>(Level::Info)};
    std::atomic<bool> color_{true};

private:
    static std::string clock() {
        using namespace std::chrono;
        auto now = system_clock::now();
        std::time_t secs = system_clock::to_time_t(now);
        auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm local{};
        localtime_r(&secs, &local);
        std::ostringstream os;
        os << std::put_time(&local, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis;
        return os.str();
    }

    std::mutex mutex_;
    std::ostream* out_ = &std::cout;
    std::ostream* err_ = &std::cerr;
};

template <typename T>
void append(std::ostringstream& os, const T& value) {
    if constexpr (std::is_same_v<T, bool>) {
        os << (value ? "true" : "false");
    } else if constexpr (std::is_convertible_v<T, std::string_view> || std::is_arithmetic_v<T>) {
        os << value;
    } else if constexpr (std::is_same_v<T, nlohmann::json>) {
        os << value.dump();
    } else if constexpr (requires { nlohmann::json(value); }) {
        os << nlohmann::json(value).dump();
    } else {
        os << value;
    }
}

template <typename... Args>
void emit(const Tag& tag, const Args&... args) {
    auto& sink = Sink::instance();
    if (!sink.accepts(tag.level)) return;
    std::ostringstream body;
    const char* sep = "";
    ((body << sep, append(body, args), sep = " "), ...);
    sink.write(tag, body.str());
}

} // namespace detail

inline void setLevel(Level lvl) {
    detail::Sink::instance().threshold_.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

inline Level level() {
    return static_cast<Level>(detail::Sink::instance().threshold_.load(std::memory_order_relaxed));
}

inline void setColor(bool enabled) {
    detail::Sink::instance().color_.store(enabled, std::memory_order_relaxed);
}

// Redirect output; nullptr restores the standard streams. With only
// `out` given, errors go there too.
inline void setSink(std::ostream* out, std::ostream* err = nullptr) {
    detail::Sink::instance().redirect(out, err);
}

template <typename... Args> void log(const Args&... args)     { detail::emit(detail::kPlain, args...); }
template <typename... Args> void debug(const Args&... args)   { detail::emit(detail::kDebug, args...); }
template <typename... Args> void info(const Args&... args)    { detail::emit(detail::kInfo, args...); }
template <typename... Args> void success(const Args&... args) { detail::emit(detail::kOk, args...); }
template <typename... Args> void warn(const Args&... args)    { detail::emit(detail::kWarn, args...); }
template <typename... Args> void error(const Args&... args)   { detail::emit(detail::kError, args...); }

// ── labelled stopwatches ──

namespace detail {

struct Stopwatches {
    std::mutex mutex;
    std::map<std::string, std::chrono::steady_clock::time_point> started;

    static Stopwatches& instance() {
        static Stopwatches s;
        return s;
    }
};

} // namespace detail

inline void time(const std::string& label) {
    auto& sw = detail::Stopwatches::instance();
    std::lock_guard<std::mutex> lock(sw.mutex);
    sw.started[label] = std::chrono::steady_clock::now();
}

// Logs "<label>: <elapsed>ms"; warns when `label` was never started.
inline void timeEnd(const std::string& label) {
    auto& sw = detail::Stopwatches::instance();
    std::unique_lock<std::mutex> lock(sw.mutex);
    auto node = sw.started.extract(label);
    lock.unlock();
    if (node.empty()) {
        warn("no stopwatch named", label);
        return;
    }
    std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - node.mapped();
    std::ostringstream ms;
    ms << std::fixed << std::setprecision(3) << elapsed.count() << "ms";
    log(label + ":", ms.str());
}

} // namespace bizgraph::console
