#include <gtest/gtest.h>
#include "auth/AuthManager.hpp"
#include "storage/Storage.hpp"
#include "TestSupport.hpp"

TEST(AuthManagerTest, SignupLoginLogout) {
    TempDir dir;
    const std::string users = Storage::userFileIn(dir.str());
    AuthManager auth(users);

    EXPECT_EQ(auth.currentSession(), nullptr);
    ASSERT_TRUE(auth.signup("anna", "correct horse"));
    EXPECT_FALSE(auth.signup("anna", "again"));
    EXPECT_FALSE(auth.signup("", "pw"));

    EXPECT_FALSE(auth.login("anna", "wrong"));
    EXPECT_FALSE(auth.login("bram", "correct horse"));
    EXPECT_EQ(auth.currentSession(), nullptr);

    ASSERT_TRUE(auth.login("anna", "correct horse"));
    const AuthSession* session = auth.currentSession();
    ASSERT_NE(session, nullptr);
    EXPECT_EQ(session->username, "anna");
    EXPECT_EQ(session->key.size(), 32u);

    auth.logout();
    EXPECT_EQ(auth.currentSession(), nullptr);
}

TEST(AuthManagerTest, SessionKeyIsStableAcrossLogins) {
    TempDir dir;
    const std::string users = Storage::userFileIn(dir.str());
    std::vector<unsigned char> first;
    {
        AuthManager auth(users);
        ASSERT_TRUE(auth.signup("anna", "pw"));
        ASSERT_TRUE(auth.login("anna", "pw"));
        first = auth.currentSession()->key;
    }

    // a fresh manager reads the users file written at signup
    AuthManager reopened(users);
    ASSERT_TRUE(reopened.login("anna", "pw"));
    EXPECT_EQ(reopened.currentSession()->key, first);
}
