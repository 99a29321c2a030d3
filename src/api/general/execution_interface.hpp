#ifndef EXECUTION_INTERFACE_HPP
#define EXECUTION_INTERFACE_HPP

#include "trader/data_structures/data_structures.hpp"
#include <string>
#include <memory>

namespace OkxTrader {
namespace API {

class ExecutionInterface {
public:
    virtual ~ExecutionInterface() = default;

    // side is "buy" or "sell"; size is passed through as the exchange expects it.
    virtual Core::OrderResult place_order(const std::string& symbol, const std::string& side, const std::string& size) = 0;
    virtual bool set_leverage(const std::string& symbol, int leverage, const std::string& margin_mode) = 0;

    virtual std::string get_client_name() const = 0;
};

using ExecutionInterfacePtr = std::unique_ptr<ExecutionInterface>;

} // namespace API
} // namespace OkxTrader

#endif // EXECUTION_INTERFACE_HPP
