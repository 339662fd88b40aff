#include "core/random_id.hpp"
#include "core/errors.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>
#include <vector>

std::string RandomId::hex(std::size_t num_bytes)
{
    std::vector<unsigned char> buffer(num_bytes);
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1)
    {
        char err_buf[256];
        ERR_error_string_n(ERR_get_error(), err_buf, sizeof(err_buf));
        throw ResourceError(std::string("Random identifier generation failed: ") + err_buf);
    }

    std::stringstream ss;
    for (unsigned char byte : buffer)
    {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return ss.str();
}
