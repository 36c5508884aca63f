#pragma once

#include "linkchat/Types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>

namespace linkchat::transfer {

class OutputSink {
public:
    virtual ~OutputSink() = default;

    virtual bool write(std::span<const std::uint8_t> data) = 0;
    virtual bool close() = 0;
};

// Returns null when the destination cannot be created.
using SinkFactory = std::function<std::unique_ptr<OutputSink>(const MacAddress& peer, const std::string& name)>;

}  // namespace linkchat::transfer
