#include "errors.hpp"

namespace querybus {

void wrapped_error::rethrow_cause() const {
    if (m_cause) std::rethrow_exception(m_cause);
    throw *this;
}

std::string describe(std::exception_ptr error) {
    if (!error) return "no error";
    try {
        std::rethrow_exception(error);
    } catch (const wrapped_error& e) {
        if (!e.cause()) return e.what();
        return std::string(e.what()) + " (caused by: " + describe(e.cause()) + ")";
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace querybus
