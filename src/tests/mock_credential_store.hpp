#ifndef VAULT_TEST_MOCK_CREDENTIAL_STORE_HPP
#define VAULT_TEST_MOCK_CREDENTIAL_STORE_HPP

#include <gmock/gmock.h>
#include "auth/credential_store.hpp"

namespace vault {
namespace test {

class MockCredentialStore : public auth::CredentialStore {
public:
  MOCK_METHOD(bool, verify, (const std::string& username, const std::string& password), (const, override));
};

} // namespace test
} // namespace vault

#endif // VAULT_TEST_MOCK_CREDENTIAL_STORE_HPP
