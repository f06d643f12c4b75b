#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <cctype>
#include <stdexcept>
#include "interface/rest_api_handler.hpp"
#include "mock_contact_repository.hpp"
#include "test_database.hpp"

using namespace contact_service;
using nlohmann::json;
using ::testing::Return;

namespace {

const char* kOrigin = "http://localhost:3000";

std::string header(const http::response<http::string_body>& res, http::field field) {
    auto value = res[field];
    return std::string(value.data(), value.size());
}

http::response<http::string_body> send(RestApiHandler& handler, http::verb verb,
                                       const std::string& target, const std::string& body = "") {
    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, "localhost");
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
    }
    req.prepare_payload();
    return handler.handleRequest(std::move(req));
}

} // namespace

class RestApiHandlerTest : public test_support::SqliteDatabaseTest {
protected:
    void SetUp() override {
        test_support::SqliteDatabaseTest::SetUp();
        handler = std::make_unique<RestApiHandler>(std::make_shared<ContactService>(repository_), kOrigin);
    }

    void TearDown() override {
        handler.reset();
        test_support::SqliteDatabaseTest::TearDown();
    }

    http::response<http::string_body> request(http::verb verb, const std::string& target,
                                              const std::string& body = "") {
        return send(*handler, verb, target, body);
    }

    json create(const std::string& name, const std::string& phone) {
        auto res = request(http::verb::post, "/contacts",
                           json{{"name", name}, {"phoneNumber", phone}}.dump());
        EXPECT_EQ(res.result(), http::status::created) << res.body();
        return json::parse(res.body());
    }

    std::unique_ptr<RestApiHandler> handler;
};


TEST_F(RestApiHandlerTest, CreateReturns201WithLocationAndContactShape) {
    auto res = request(http::verb::post, "/contacts",
                       R"({"name":"John Doe","phoneNumber":"+11234567890","email":"john@example.com"})");
    ASSERT_EQ(res.result(), http::status::created) << res.body();
    EXPECT_EQ(header(res, http::field::content_type), "application/json");

    auto body = json::parse(res.body());
    ASSERT_TRUE(body.contains("id"));
    EXPECT_EQ(header(res, http::field::location), "/contacts/" + body["id"].get<std::string>());
    EXPECT_EQ(body["name"], "John Doe");
    EXPECT_EQ(body["phoneNumber"], "+11234567890");
    EXPECT_EQ(body["email"], "john@example.com");
    ASSERT_TRUE(body["createdAt"].is_string());
    EXPECT_EQ(body["createdAt"].get<std::string>().back(), 'Z');
    EXPECT_TRUE(body["updatedAt"].is_null());
}

TEST_F(RestApiHandlerTest, GetByIdRoundTripsCreatedContact) {
    auto created = create("John Doe", "+11234567890");

    auto res = request(http::verb::get, "/contacts/" + created["id"].get<std::string>());
    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(json::parse(res.body()), created);
}

TEST_F(RestApiHandlerTest, ListReturnsArrayOfContacts) {
    create("John Doe", "+11234567890");
    create("Jane Doe", "+19876543210");

    auto res = request(http::verb::get, "/contacts");
    ASSERT_EQ(res.result(), http::status::ok);
    auto body = json::parse(res.body());
    ASSERT_TRUE(body.is_array());
    EXPECT_EQ(body.size(), 2u);
}

TEST_F(RestApiHandlerTest, ListOfEmptyBookIsEmptyArray) {
    auto res = request(http::verb::get, "/contacts");
    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "[]");
}

TEST_F(RestApiHandlerTest, DuplicatePhoneIsBadRequest) {
    create("John Doe", "+11234567890");

    auto res = request(http::verb::post, "/contacts",
                       R"({"name":"Jane Doe","phoneNumber":"+11234567890"})");
    ASSERT_EQ(res.result(), http::status::bad_request);
    auto body = json::parse(res.body());
    EXPECT_EQ(body["status"], 400);
    EXPECT_EQ(body["message"], "Phone number already exists");
    EXPECT_TRUE(body["detailedMessage"].is_string());
}

TEST_F(RestApiHandlerTest, ValidationErrorsNameTheFields) {
    auto res = request(http::verb::post, "/contacts", R"({"name":"","phoneNumber":"0123"})");
    ASSERT_EQ(res.result(), http::status::bad_request);
    auto body = json::parse(res.body());
    EXPECT_EQ(body["status"], 400);
    EXPECT_EQ(body["message"], "Validation failed");
    auto detail = body["detailedMessage"].get<std::string>();
    EXPECT_NE(detail.find("name"), std::string::npos);
    EXPECT_NE(detail.find("phoneNumber"), std::string::npos);

    auto list = request(http::verb::get, "/contacts");
    EXPECT_EQ(list.body(), "[]");
}

TEST_F(RestApiHandlerTest, MalformedJsonIsBadRequest) {
    auto res = request(http::verb::post, "/contacts", "{not json");
    ASSERT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(json::parse(res.body())["message"], "Invalid request body");

    auto empty = request(http::verb::post, "/contacts");
    EXPECT_EQ(empty.result(), http::status::bad_request);
}

TEST_F(RestApiHandlerTest, UpdateReturnsUpdatedContact) {
    auto created = create("John Doe", "+11234567890");
    auto id = created["id"].get<std::string>();

    auto res = request(http::verb::put, "/contacts/" + id,
                       R"({"name":"John Q. Doe","phoneNumber":"+11234567890","email":"jq@example.com"})");
    ASSERT_EQ(res.result(), http::status::ok) << res.body();
    auto body = json::parse(res.body());
    EXPECT_EQ(body["id"], id);
    EXPECT_EQ(body["name"], "John Q. Doe");
    EXPECT_EQ(body["email"], "jq@example.com");
    EXPECT_EQ(body["createdAt"], created["createdAt"]);
    EXPECT_TRUE(body["updatedAt"].is_string());
}

TEST_F(RestApiHandlerTest, UpdateToTakenPhoneIsBadRequest) {
    create("John Doe", "+11234567890");
    auto jane = create("Jane Doe", "+19876543210");

    auto res = request(http::verb::put, "/contacts/" + jane["id"].get<std::string>(),
                       R"({"name":"Jane Doe","phoneNumber":"+11234567890"})");
    ASSERT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(json::parse(res.body())["message"], "Phone number already exists for another contact");
}

TEST_F(RestApiHandlerTest, UpdateOfUnknownIdIsNotFound) {
    const std::string ghost = "55555555-5555-4555-8555-555555555555";
    auto res = request(http::verb::put, "/contacts/" + ghost,
                       R"({"name":"Ghost","phoneNumber":"+15550000000"})");
    ASSERT_EQ(res.result(), http::status::not_found);
    auto body = json::parse(res.body());
    EXPECT_EQ(body["status"], 404);
    EXPECT_EQ(body["message"], "Contact with ID " + ghost + " not found");

    EXPECT_EQ(request(http::verb::get, "/contacts").body(), "[]");
}

TEST_F(RestApiHandlerTest, DeleteReturns204ThenGetIsNotFound) {
    auto created = create("John Doe", "+11234567890");
    auto id = created["id"].get<std::string>();

    auto res = request(http::verb::delete_, "/contacts/" + id);
    ASSERT_EQ(res.result(), http::status::no_content);
    EXPECT_TRUE(res.body().empty());

    EXPECT_EQ(request(http::verb::get, "/contacts/" + id).result(), http::status::not_found);
    EXPECT_EQ(request(http::verb::get, "/contacts/search?searchTerm=John").body(), "[]");
}

TEST_F(RestApiHandlerTest, DeleteOfUnknownIdIsNotFound) {
    auto res = request(http::verb::delete_, "/contacts/55555555-5555-4555-8555-555555555555");
    EXPECT_EQ(res.result(), http::status::not_found);
}

TEST_F(RestApiHandlerTest, SearchFiltersByTerm) {
    create("John Doe", "+11234567890");
    create("Jane Doe", "+19876543210");

    auto johns = json::parse(request(http::verb::get, "/contacts/search?searchTerm=John").body());
    ASSERT_EQ(johns.size(), 1u);
    EXPECT_EQ(johns[0]["name"], "John Doe");

    auto encoded = json::parse(request(http::verb::get, "/contacts/search?searchTerm=John%20Doe").body());
    EXPECT_EQ(encoded.size(), 1u);

    auto plus = json::parse(request(http::verb::get, "/contacts/search?searchTerm=Jane+Doe").body());
    ASSERT_EQ(plus.size(), 1u);
    EXPECT_EQ(plus[0]["name"], "Jane Doe");

    auto by_phone = json::parse(request(http::verb::get, "/contacts/search?searchTerm=%2B1987").body());
    ASSERT_EQ(by_phone.size(), 1u);
    EXPECT_EQ(by_phone[0]["name"], "Jane Doe");
}

TEST_F(RestApiHandlerTest, SearchWithoutTermReturnsAll) {
    create("John Doe", "+11234567890");
    create("Jane Doe", "+19876543210");

    EXPECT_EQ(json::parse(request(http::verb::get, "/contacts/search?searchTerm=").body()).size(), 2u);
    EXPECT_EQ(json::parse(request(http::verb::get, "/contacts/search").body()).size(), 2u);
}

TEST_F(RestApiHandlerTest, ApiPrefixIsAccepted) {
    auto res = request(http::verb::post, "/api/contacts",
                       R"({"name":"John Doe","phoneNumber":"+11234567890"})");
    ASSERT_EQ(res.result(), http::status::created);
    auto id = json::parse(res.body())["id"].get<std::string>();
    EXPECT_EQ(header(res, http::field::location), "/api/contacts/" + id);

    EXPECT_EQ(request(http::verb::get, "/api/contacts/" + id).result(), http::status::ok);
}

TEST_F(RestApiHandlerTest, IdIsMatchedCaseInsensitively) {
    auto id = create("John Doe", "+11234567890")["id"].get<std::string>();
    std::string upper = id;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    EXPECT_EQ(request(http::verb::get, "/contacts/" + upper).result(), http::status::ok);
}

TEST_F(RestApiHandlerTest, MalformedIdIsBadRequest) {
    auto res = request(http::verb::get, "/contacts/not-a-uuid");
    ASSERT_EQ(res.result(), http::status::bad_request);
    EXPECT_NE(json::parse(res.body())["detailedMessage"].get<std::string>().find("id"), std::string::npos);
}

TEST_F(RestApiHandlerTest, IdWithInvalidUtf8IsBadRequest) {
    auto res = request(http::verb::get, "/contacts/%FF");
    ASSERT_EQ(res.result(), http::status::bad_request);
    auto body = json::parse(res.body());
    EXPECT_EQ(body["status"], 400);
    EXPECT_EQ(body["message"], "Validation failed");
}

TEST_F(RestApiHandlerTest, UnknownPathIsNotFound) {
    auto res = request(http::verb::get, "/users");
    ASSERT_EQ(res.result(), http::status::not_found);
    EXPECT_EQ(json::parse(res.body())["status"], 404);

    EXPECT_EQ(request(http::verb::get, "/contacts/a/b").result(), http::status::not_found);
}

TEST_F(RestApiHandlerTest, UnsupportedMethodIsMethodNotAllowed) {
    auto res = request(http::verb::patch, "/contacts");
    ASSERT_EQ(res.result(), http::status::method_not_allowed);
    EXPECT_EQ(header(res, http::field::allow), "GET, POST, OPTIONS");
}

TEST_F(RestApiHandlerTest, PreflightAndResponsesCarryCorsHeaders) {
    auto preflight = request(http::verb::options, "/contacts");
    EXPECT_EQ(preflight.result(), http::status::ok);
    EXPECT_EQ(header(preflight, http::field::access_control_allow_origin), kOrigin);

    auto list = request(http::verb::get, "/contacts");
    EXPECT_EQ(header(list, http::field::access_control_allow_origin), kOrigin);
    EXPECT_FALSE(header(list, http::field::access_control_allow_methods).empty());
}


class RestApiHandlerFailureTest : public ::testing::Test {
protected:
    std::shared_ptr<test_support::MockContactRepository> repository =
        std::make_shared<test_support::MockContactRepository>();
    RestApiHandler handler{std::make_shared<ContactService>(repository)};
};


TEST_F(RestApiHandlerFailureTest, StorageErrorIs500WithGenericBody) {
    EXPECT_CALL(*repository, getAll()).WillOnce(Return(std::unexpected(
        StorageError{StorageErrc::storage, "database disk image is malformed"})));

    auto res = send(handler, http::verb::get, "/contacts");
    ASSERT_EQ(res.result(), http::status::internal_server_error);
    auto body = json::parse(res.body());
    EXPECT_EQ(body["status"], 500);
    EXPECT_EQ(body["message"], "An error occurred while retrieving contacts");
    EXPECT_EQ(res.body().find("malformed"), std::string::npos);
}

TEST_F(RestApiHandlerFailureTest, EscapedExceptionIs500WithoutItsText) {
    EXPECT_CALL(*repository, search(::testing::_))
        .WillOnce([](const ContactQuery&) -> std::expected<std::vector<Contact>, StorageError> {
            throw std::runtime_error("secret stack detail");
        });

    auto res = send(handler, http::verb::get, "/contacts/search?searchTerm=x");
    ASSERT_EQ(res.result(), http::status::internal_server_error);
    auto body = json::parse(res.body());
    EXPECT_EQ(body["status"], 500);
    EXPECT_EQ(res.body().find("secret"), std::string::npos);
}
