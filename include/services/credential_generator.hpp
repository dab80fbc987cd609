#ifndef APROTATE_SERVICES_CREDENTIAL_GENERATOR_HPP
#define APROTATE_SERVICES_CREDENTIAL_GENERATOR_HPP

#include <string>

namespace aprotate
{
    namespace services
    {

        /**
         * Random network names and passphrases from the OpenSSL CSPRNG.
         * Throws std::runtime_error if the CSPRNG cannot produce bytes.
         */
        class CredentialGenerator
        {
        public:
            static constexpr const char *SSID_ALPHABET = "abcdefghijklmnopqrstuvwxyz0123456789";
            static constexpr const char *PASSWORD_ALPHABET =
                "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

            // prefix + `length` lowercase alphanumerics
            std::string generate_ssid(const std::string &prefix, int length) const;

            // `length` mixed-case alphanumerics
            std::string generate_password(int length) const;

            // Uniform selection from `alphabet`
            static std::string random_string(const std::string &alphabet, int length);
        };

    } // namespace services
} // namespace aprotate

#endif // APROTATE_SERVICES_CREDENTIAL_GENERATOR_HPP
