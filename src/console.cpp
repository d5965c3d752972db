#include "console.hpp"

namespace gfc_extract {

std::mutex& console_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace gfc_extract
