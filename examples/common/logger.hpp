#pragma once

#include <string_view>

#include "sumquery/log/logger.hpp"


namespace sumquery::examples {

    inline void set_log_level(std::string_view log_level) {
        log::Logger::instance().set_level(log::parse_level(log_level));
    }

} // namespace sumquery::examples
