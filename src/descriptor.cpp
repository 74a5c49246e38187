#include "descriptor.hpp"

#include <unistd.h>

#include <cerrno>

namespace b64stream {

int duplicate_descriptor(int fd)
{
    auto result = ::dup(fd);
    if (result < 0)
        throw system_error(error_code(errno, boost::system::system_category()),
                           "cannot duplicate descriptor");
    return result;
}

}
