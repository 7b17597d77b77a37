/**
 * @file test_dns_sd.cpp
 * @brief Unit tests for DNS-SD label and TXT decoding
 */

#include <gtest/gtest.h>
#include <gatelink/core/dns_sd.hpp>

using namespace gatelink::core;

TEST(DnsSdTest, UnescapeDecimalEscapes) {
    EXPECT_EQ(unescapeLabel("Office\\032Gateway"), "Office Gateway");
    EXPECT_EQ(unescapeLabel("a\\046b"), "a.b");
}

TEST(DnsSdTest, UnescapeCharacterEscapes) {
    EXPECT_EQ(unescapeLabel("a\\.b"), "a.b");
    EXPECT_EQ(unescapeLabel("back\\\\slash"), "back\\slash");
}

TEST(DnsSdTest, UnescapeLeavesMalformedEscapes) {
    EXPECT_EQ(unescapeLabel("x\\999y"), "x\\999y");
    EXPECT_EQ(unescapeLabel("x\\03"), "x\\03");
    EXPECT_EQ(unescapeLabel("trailing\\"), "trailing\\");
    EXPECT_EQ(unescapeLabel(""), "");
}

TEST(DnsSdTest, Utf8Validation) {
    EXPECT_TRUE(isValidUtf8("plain"));
    EXPECT_TRUE(isValidUtf8("caf\xC3\xA9"));
    EXPECT_TRUE(isValidUtf8("\xE2\x80\xA2"));
    EXPECT_TRUE(isValidUtf8("\xF0\x9F\x98\x80"));

    EXPECT_FALSE(isValidUtf8("caf\xE9"));         // Latin-1 byte
    EXPECT_FALSE(isValidUtf8("\xC0\xAF"));        // overlong
    EXPECT_FALSE(isValidUtf8("\xED\xA0\x80"));    // surrogate
    EXPECT_FALSE(isValidUtf8("\xE2\x80"));        // truncated
    EXPECT_FALSE(isValidUtf8("\xF4\x90\x80\x80"));  // above U+10FFFF
}

TEST(DnsSdTest, TxtStringFallsBackToLatin1) {
    EXPECT_EQ(decodeTxtString("caf\xC3\xA9"), "caf\xC3\xA9");
    EXPECT_EQ(decodeTxtString("caf\xE9"), "caf\xC3\xA9");
}

TEST(DnsSdTest, TxtValueLookup) {
    std::vector<std::string> txt = {
        "lanHost= gw.lan ",
        "gatewayPort=18789",
        "empty=",
        "gatewayTls=TRUE",
        "lanHost=second.lan",
    };

    EXPECT_EQ(txtValue(txt, "lanHost"), "gw.lan");
    EXPECT_FALSE(txtValue(txt, "empty").has_value());
    EXPECT_FALSE(txtValue(txt, "missing").has_value());
    EXPECT_FALSE(txtValue(txt, "lan").has_value());

    EXPECT_EQ(txtInt(txt, "gatewayPort"), 18789);
    EXPECT_FALSE(txtInt(txt, "lanHost").has_value());

    EXPECT_TRUE(txtBool(txt, "gatewayTls"));
    EXPECT_FALSE(txtBool(txt, "lanHost"));
    EXPECT_FALSE(txtBool(txt, "missing"));
}

TEST(DnsSdTest, TxtBoolAcceptedSpellings) {
    EXPECT_TRUE(txtBool({"k=1"}, "k"));
    EXPECT_TRUE(txtBool({"k=yes"}, "k"));
    EXPECT_TRUE(txtBool({"k=True"}, "k"));
    EXPECT_FALSE(txtBool({"k=0"}, "k"));
    EXPECT_FALSE(txtBool({"k=on"}, "k"));
}

TEST(DnsSdTest, InstanceNameFromWideAreaFqdn) {
    EXPECT_EQ(instanceNameFromFqdn("Office\\032Gateway._openclaw-gw._tcp.example.com.",
                                   "_openclaw-gw._tcp.", "example.com."),
              "Office Gateway");
    EXPECT_EQ(instanceNameFromFqdn("Studio._OPENCLAW-GW._tcp.Example.com",
                                   "_openclaw-gw._tcp.", "example.com"),
              "Studio");
}

TEST(DnsSdTest, InstanceNameFromLocalFqdn) {
    EXPECT_EQ(instanceNameFromFqdn("Den\\032\\032Box._openclaw-gw._tcp.local.",
                                   "_openclaw-gw._tcp.", "local."),
              "Den Box");
}

TEST(DnsSdTest, InstanceNameWhenDomainDiffers) {
    EXPECT_EQ(instanceNameFromFqdn("Lab._openclaw-gw._tcp.other.net.",
                                   "_openclaw-gw._tcp.", "example.com."),
              "Lab");
}
