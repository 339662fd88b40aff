#pragma once

#include <cstddef>
#include <string>

class RandomId
{
public:
    /**
     * @brief Generate a lowercase hex identifier from the OpenSSL CSPRNG
     * @param num_bytes Number of random bytes (the result has twice as many characters)
     * @throws ResourceError if the random generator cannot be seeded
     */
    static std::string hex(std::size_t num_bytes = 16);
};
