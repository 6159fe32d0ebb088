/*
 * sink_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-05

Description: Builds spdlog sinks from SinkConfig entries

**************************************************/

#ifndef RAMPART_LOGGING_SINKS_SINK_FACTORY_HPP
#define RAMPART_LOGGING_SINKS_SINK_FACTORY_HPP

#include <string_view>

#include <spdlog/spdlog.h>

#include "../core/types.hpp"

namespace rampart::logging {

class SinkFactory {
public:
    /**
     * @brief Create the sink described by @p config
     *
     * Parent directories of file sinks are created. The sink gets the
     * config's own pattern, or @p fallbackPattern when it has none.
     *
     * @return nullptr when the sink cannot be opened; the error is logged
     */
    [[nodiscard]] static auto createSink(const SinkConfig& config,
                                         std::string_view fallbackPattern)
        -> spdlog::sink_ptr;

private:
    [[nodiscard]] static auto openSink(const SinkConfig& config)
        -> spdlog::sink_ptr;
};

}  // namespace rampart::logging

#endif  // RAMPART_LOGGING_SINKS_SINK_FACTORY_HPP
