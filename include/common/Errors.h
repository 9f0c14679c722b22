#pragma once

#include <stdexcept>
#include <string>

namespace swingrisk {

class RiskError : public std::runtime_error {
public:
    explicit RiskError(const std::string& what) : std::runtime_error(what) {}
};

// 잘못된 가격/스냅샷. 상태 변경 전에 거부된다.
class InvalidInput : public RiskError {
public:
    explicit InvalidInput(const std::string& what) : RiskError("invalid input: " + what) {}
};

class DuplicatePosition : public RiskError {
public:
    explicit DuplicatePosition(const std::string& symbol)
        : RiskError("position already active: " + symbol) {}
};

class PositionNotFound : public RiskError {
public:
    explicit PositionNotFound(const std::string& symbol)
        : RiskError("no active position: " + symbol) {}
};

class ConfigError : public RiskError {
public:
    explicit ConfigError(const std::string& what) : RiskError("config error: " + what) {}
};

} // namespace swingrisk
