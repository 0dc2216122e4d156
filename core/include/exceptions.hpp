#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class AutoTraderException : public std::runtime_error {
    public:
        explicit AutoTraderException(const std::string& message)
            : std::runtime_error(message) {}

        explicit AutoTraderException(const char* message)
            : std::runtime_error(message) {}
    };

    // Invalid parameter combination, raised at start-up
    class ConfigException : public AutoTraderException {
    public: using AutoTraderException::AutoTraderException; };

    // Malformed or missing bar data; halts a replay
    class DataException : public AutoTraderException {
    public: using AutoTraderException::AutoTraderException; };

    class ApiRequestException : public AutoTraderException {
    public: using AutoTraderException::AutoTraderException; };

    // Broker call failed, was rejected or timed out
    class ExecutionException : public AutoTraderException {
    public: using AutoTraderException::AutoTraderException; };

    class IndicatorCalculationException : public AutoTraderException {
    public: using AutoTraderException::AutoTraderException; };

    class StrategyException : public AutoTraderException {
    public: using AutoTraderException::AutoTraderException; };

    class StorageException : public AutoTraderException {
    public: using AutoTraderException::AutoTraderException; };

    class BacktestException : public AutoTraderException {
    public: using AutoTraderException::AutoTraderException; };

    // Programming contract broken (lookahead, fill bypassing the portfolio, oversell).
    // Never recovered from: the run is aborted.
    class InvariantViolation : public AutoTraderException {
    public: using AutoTraderException::AutoTraderException; };

} // namespace core
