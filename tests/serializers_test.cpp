#include <gtest/gtest.h>

#include "net/serializers.hpp"

using namespace relay;

namespace {
const url_request REQUEST(http_method::get, "https://example.com/resource");

http_response response_with_type(const std::string& content_type) {
    http_response response;
    response.status_code = 200;
    response.headers["Content-Type"] = content_type;
    return response;
}

const char* PLIST = R"(<?xml version="1.0" encoding="UTF-8"?>
<!DOCTYPE plist PUBLIC "-//Apple//DTD PLIST 1.0//EN" "http://www.apple.com/DTDs/PropertyList-1.0.dtd">
<plist version="1.0">
<dict>
    <key>name</key>
    <string>relay</string>
    <key>count</key>
    <integer>42</integer>
    <key>ratio</key>
    <real>0.5</real>
    <key>enabled</key>
    <true/>
    <key>tags</key>
    <array>
        <string>a</string>
        <false/>
    </array>
    <key>payload</key>
    <data>aGVsbG8=</data>
</dict>
</plist>
)";
} // namespace

TEST(DataSerializer, ReturnsBytesUnchanged) {
    auto result = data_serializer()(REQUEST, std::nullopt, std::string("\x00\x01raw", 5));
    ASSERT_TRUE(result.value);
    EXPECT_EQ(*result.value, std::string("\x00\x01raw", 5));
    EXPECT_FALSE(result.error);
}

TEST(DataSerializer, AbsentBodyIsNotAnError) {
    auto result = data_serializer()(REQUEST, std::nullopt, std::nullopt);
    EXPECT_FALSE(result.value);
    EXPECT_FALSE(result.error);
}

TEST(StringSerializer, EmptyBodyYieldsNothing) {
    auto empty = string_serializer()(REQUEST, std::nullopt, std::string());
    EXPECT_FALSE(empty.value);
    EXPECT_FALSE(empty.error);

    auto absent = string_serializer()(REQUEST, std::nullopt, std::nullopt);
    EXPECT_FALSE(absent.value);
    EXPECT_FALSE(absent.error);
}

TEST(StringSerializer, FallsBackToLatin1) {
    auto result = string_serializer()(REQUEST, std::nullopt, std::string("caf\xE9"));
    ASSERT_TRUE(result.value);
    EXPECT_EQ(*result.value, "caf\xC3\xA9");
}

TEST(StringSerializer, UsesDeclaredCharset) {
    auto response = response_with_type("text/plain; charset=utf-8");
    auto result = string_serializer()(REQUEST, response, std::string("caf\xC3\xA9"));
    ASSERT_TRUE(result.value);
    EXPECT_EQ(*result.value, "caf\xC3\xA9");
}

TEST(StringSerializer, UnrecognizedCharsetFallsBackToLatin1) {
    auto response = response_with_type("text/plain; charset=x-no-such-charset");
    auto result = string_serializer()(REQUEST, response, std::string("\xE9"));
    ASSERT_TRUE(result.value);
    EXPECT_EQ(*result.value, "\xC3\xA9");
}

TEST(StringSerializer, ExplicitEncodingWinsOverDeclaredCharset) {
    auto response = response_with_type("text/plain; charset=utf-8");
    auto result = string_serializer("ISO-8859-1")(REQUEST, response, std::string("\xE9"));
    ASSERT_TRUE(result.value);
    EXPECT_EQ(*result.value, "\xC3\xA9");
}

TEST(StringSerializer, UndecodableBytesAreAnError) {
    auto result = string_serializer("UTF-8")(REQUEST, std::nullopt, std::string("abc\xFF"));
    EXPECT_FALSE(result.value);
    ASSERT_TRUE(result.error);
    EXPECT_EQ(result.error->kind, error_kind::serialization);
    ASSERT_TRUE(result.error->offset);
    EXPECT_EQ(*result.error->offset, 3u);
}

TEST(StringSerializer, UnknownExplicitEncodingIsAnError) {
    auto result = string_serializer("x-no-such-charset")(REQUEST, std::nullopt, std::string("a"));
    EXPECT_FALSE(result.value);
    ASSERT_TRUE(result.error);
    EXPECT_EQ(result.error->kind, error_kind::serialization);
}

TEST(JsonSerializer, ParsesObjects) {
    auto result = json_serializer()(REQUEST, std::nullopt, std::string(R"({"a": [1, 2], "b": null})"));
    ASSERT_TRUE(result.value);
    EXPECT_FALSE(result.error);
    EXPECT_EQ((*result.value)["a"][1], 2);
    EXPECT_TRUE((*result.value)["b"].is_null());
}

TEST(JsonSerializer, EmptyBodyYieldsNothing) {
    auto result = json_serializer()(REQUEST, std::nullopt, std::string());
    EXPECT_FALSE(result.value);
    EXPECT_FALSE(result.error);
}

TEST(JsonSerializer, TruncatedInputIsASerializationError) {
    auto result = json_serializer()(REQUEST, std::nullopt, std::string(R"({"a": [1, 2)"));
    EXPECT_FALSE(result.value);
    ASSERT_TRUE(result.error);
    EXPECT_EQ(result.error->kind, error_kind::serialization);
    ASSERT_TRUE(result.error->offset);
    EXPECT_GT(*result.error->offset, 0u);
    EXPECT_FALSE(result.error->message.empty());
}

TEST(JsonSerializer, FragmentsDependOnOptions) {
    auto fragment = json_serializer()(REQUEST, std::nullopt, std::string("42"));
    ASSERT_TRUE(fragment.value);
    EXPECT_EQ(*fragment.value, 42);

    json_options strict;
    strict.allow_fragments = false;
    auto rejected = json_serializer(strict)(REQUEST, std::nullopt, std::string("\"text\""));
    EXPECT_FALSE(rejected.value);
    ASSERT_TRUE(rejected.error);
    EXPECT_EQ(rejected.error->kind, error_kind::serialization);

    auto accepted = json_serializer(strict)(REQUEST, std::nullopt, std::string("[]"));
    ASSERT_TRUE(accepted.value);
    EXPECT_TRUE(accepted.value->is_array());
}

TEST(PropertyListSerializer, ConvertsDictionary) {
    auto result = property_list_serializer()(REQUEST, std::nullopt, std::string(PLIST));
    ASSERT_FALSE(result.error) << result.error->describe();
    ASSERT_TRUE(result.value);

    const nlohmann::json& plist = *result.value;
    EXPECT_EQ(plist["name"], "relay");
    EXPECT_EQ(plist["count"], 42);
    EXPECT_DOUBLE_EQ(plist["ratio"].get<double>(), 0.5);
    EXPECT_EQ(plist["enabled"], true);
    ASSERT_TRUE(plist["tags"].is_array());
    EXPECT_EQ(plist["tags"].size(), 2u);
    EXPECT_EQ(plist["tags"][1], false);

    ASSERT_TRUE(plist["payload"].is_binary());
    const auto& bytes = plist["payload"].get_binary();
    EXPECT_EQ(std::string(bytes.begin(), bytes.end()), "hello");
}

TEST(PropertyListSerializer, KeepsBase64WhenNotDecoding) {
    plist_options options;
    options.decode_data = false;
    auto result = property_list_serializer(options)(REQUEST, std::nullopt, std::string(PLIST));
    ASSERT_TRUE(result.value);
    EXPECT_EQ((*result.value)["payload"], "aGVsbG8=");
}

TEST(PropertyListSerializer, UnknownElements) {
    const std::string body = "<plist><array><string>a</string><color>red</color></array></plist>";

    auto strict = property_list_serializer()(REQUEST, std::nullopt, body);
    EXPECT_FALSE(strict.value);
    ASSERT_TRUE(strict.error);
    EXPECT_NE(strict.error->message.find("color"), std::string::npos);

    plist_options lenient;
    lenient.allow_unknown_elements = true;
    auto skipped = property_list_serializer(lenient)(REQUEST, std::nullopt, body);
    ASSERT_TRUE(skipped.value);
    EXPECT_EQ(*skipped.value, nlohmann::json::array({"a"}));
}

TEST(PropertyListSerializer, MalformedXmlReportsPosition) {
    auto result = property_list_serializer()(REQUEST, std::nullopt,
                                             std::string("<plist><dict><key>a</key>"));
    EXPECT_FALSE(result.value);
    ASSERT_TRUE(result.error);
    EXPECT_EQ(result.error->kind, error_kind::serialization);
    EXPECT_NE(result.error->message.find("line"), std::string::npos);
}

TEST(PropertyListSerializer, RejectsOtherRootElements) {
    auto result = property_list_serializer()(REQUEST, std::nullopt,
                                             std::string("<dict><key>a</key><true/></dict>"));
    EXPECT_FALSE(result.value);
    ASSERT_TRUE(result.error);
}

TEST(PropertyListSerializer, EmptyBodyYieldsNothing) {
    auto result = property_list_serializer()(REQUEST, std::nullopt, std::string());
    EXPECT_FALSE(result.value);
    EXPECT_FALSE(result.error);
}

TEST(PropertyListSerializer, RejectsDocumentsOverTheSizeLimit) {
    plist_options options;
    options.max_document_size = 16;
    const std::string body = "<plist><string>longer than sixteen bytes</string></plist>";

    auto result = property_list_serializer(options)(REQUEST, std::nullopt, body);
    EXPECT_FALSE(result.value);
    ASSERT_TRUE(result.error);
    EXPECT_EQ(result.error->kind, error_kind::serialization);
    EXPECT_NE(result.error->message.find("limit"), std::string::npos);

    options.max_document_size = body.size();
    EXPECT_TRUE(property_list_serializer(options)(REQUEST, std::nullopt, body).value);
}

TEST(PropertyListSerializer, SizeLimitNeverExceedsWhatLibxml2Accepts) {
    EXPECT_EQ(plist_options().max_document_size,
              static_cast<std::size_t>(std::numeric_limits<int>::max()));
}
