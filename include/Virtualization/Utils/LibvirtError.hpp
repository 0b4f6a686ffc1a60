#pragma once
#include <libvirt/libvirt.h>
#include <libvirt/virterror.h>
#include <string>
#include <system_error>
#include "Utils/Exception.hpp"

class LibvirtErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "libvirt";
    }

    std::string message(int condition) const override;
};

[[nodiscard]] const std::error_category& libvirt_category() noexcept;

/**
 * @brief Snapshot of the last libvirt error on the calling thread.
 */
struct LibvirtError {
    int code{VIR_ERR_OK};
    std::string message;

    [[nodiscard]] static LibvirtError last();

    [[nodiscard]] bool is(virErrorNumber number) const noexcept { return code == number; }

    [[nodiscard]] std::error_code toErrorCode() const noexcept {
        return std::error_code(code, libvirt_category());
    }
};

// يحوّل آخر خطأ من libvirt إلى استثناء من تصنيف الأخطاء
[[noreturn]] void throwLibvirtError(const std::string& action, ErrorKind fallback);

[[noreturn]] void throwLabException(ErrorKind kind, const std::string& msg);
