#include "nblisten/core/error.hpp"

#include <ostream>

namespace nblisten {

error::error(std::error_code code) noexcept : code_(code) {}

error error::from_errno(int value) noexcept {
    return error{std::error_code{value, std::system_category()}};
}

std::error_code error::code() const noexcept {
    return code_;
}

int error::value() const noexcept {
    return code_.value();
}

std::string error::message() const {
    return code_.message();
}

bool error::is(int os_value) const noexcept {
    return code_.value() == os_value;
}

error make_error_from_errno(int value) noexcept {
    return error::from_errno(value);
}

std::ostream& operator<<(std::ostream& out, const error& value) {
    return out << value.message() << " (" << value.value() << ')';
}

} // namespace nblisten
