#include "services/credential_generator.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>
#include <stdexcept>
#include <vector>

namespace aprotate
{
    namespace services
    {

        std::string CredentialGenerator::generate_ssid(const std::string &prefix, int length) const
        {
            return prefix + random_string(SSID_ALPHABET, length);
        }

        std::string CredentialGenerator::generate_password(int length) const
        {
            return random_string(PASSWORD_ALPHABET, length);
        }

        std::string CredentialGenerator::random_string(const std::string &alphabet, int length)
        {
            if (alphabet.empty() || alphabet.size() > 256)
            {
                throw std::invalid_argument("alphabet size must be between 1 and 256");
            }
            if (length <= 0)
            {
                return std::string();
            }

            // Bytes at or above `limit` would bias the modulo; draw again
            const unsigned limit = 256 - (256 % alphabet.size());

            std::string result;
            result.reserve(static_cast<size_t>(length));
            std::vector<unsigned char> pool(static_cast<size_t>(length) * 2);

            while (result.size() < static_cast<size_t>(length))
            {
                if (RAND_bytes(pool.data(), static_cast<int>(pool.size())) != 1)
                {
                    throw std::runtime_error("RAND_bytes failed: error " + std::to_string(ERR_get_error()));
                }

                for (unsigned char byte : pool)
                {
                    if (byte >= limit)
                    {
                        continue;
                    }
                    result += alphabet[byte % alphabet.size()];
                    if (result.size() == static_cast<size_t>(length))
                    {
                        break;
                    }
                }
            }

            return result;
        }

    } // namespace services
} // namespace aprotate
