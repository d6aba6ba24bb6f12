/**
 * \file console.hpp
 * \brief Line-oriented output shared by concurrently running pipeline stages.
 */
#pragma once
#include <iostream>
#include <mutex>
#include <string_view>

namespace docsync {

/**
 * \brief Writes whole lines under one mutex so output from different threads never interleaves.
 * \details Progress and summary lines go to \c out, warnings to \c err.
 */
class Console {
public:
    explicit Console(std::ostream &out = std::cout, std::ostream &err = std::cerr) : out_(out), err_(err) {}

    void line(std::string_view text) {
        std::lock_guard<std::mutex> lk(mutex_);
        out_ << text << '\n';
        out_.flush();
    }

    void warn(std::string_view text) {
        std::lock_guard<std::mutex> lk(mutex_);
        err_ << "Warn: " << text << '\n';
    }

private:
    std::mutex mutex_;
    std::ostream &out_;
    std::ostream &err_;
};

} // namespace docsync
