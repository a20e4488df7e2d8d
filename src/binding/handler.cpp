#include "cliapp/handler.hpp"

namespace cliapp {

bool Handler::uses_records() const {
    for (const auto& param : params) {
        if (param.kind == Kind::Record) return true;
    }
    return false;
}

} // namespace cliapp
