#include "rqsynth/core/request_assembler.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>

using namespace rqsynth::http;

namespace {

request_draft get_draft(std::string uri) {
    request_draft draft;
    draft.http_method = method::get;
    draft.uri = std::move(uri);
    return draft;
}

} // namespace

TEST(AssembleUri, GetWithoutParamsKeepsUri) {
    auto draft = get_draft("/posts");
    EXPECT_EQ(assemble_uri(draft), "/posts");
}

TEST(AssembleUri, GetWithParamsAppendsQuery) {
    auto draft = get_draft("/posts");
    draft.params["ordered"] = {"1"};
    draft.params["q"] = {"hello world"};
    EXPECT_EQ(assemble_uri(draft), "/posts?ordered=1&q=hello%20world");
}

TEST(AssembleUri, NonGetIgnoresParams) {
    auto draft = get_draft("/login");
    draft.http_method = method::post;
    draft.params["user"] = {"bob"};
    EXPECT_EQ(assemble_uri(draft), "/login");
}

TEST(AssembleHeaders, PatchesMultipartContentType) {
    request_draft draft;
    draft.content_type = std::string(MULTIPART_FORM_DATA);
    draft.headers.set("Content-Type", MULTIPART_FORM_DATA);
    draft.headers.set("Accept", "application/json");

    auto headers = assemble_headers(draft, std::string("snap-boundary-abc"));
    EXPECT_EQ(headers.get("Content-Type").value_or(""),
              "multipart/form-data; boundary=snap-boundary-abc");
    EXPECT_EQ(headers.get("Accept").value_or(""), "application/json");
    EXPECT_EQ(draft.headers.get("Content-Type").value_or(""), "multipart/form-data");
}

TEST(AssembleHeaders, InsertsContentTypeWhenCallerRemovedIt) {
    request_draft draft;
    draft.content_type = std::string(MULTIPART_FORM_DATA);

    auto headers = assemble_headers(draft, std::string("b"));
    EXPECT_EQ(headers.get("content-type").value_or(""), "multipart/form-data; boundary=b");
}

TEST(AssembleHeaders, OtherTagsPassThroughEvenWithBoundary) {
    request_draft draft;
    draft.content_type = "multipart/related";
    draft.headers.set("Content-Type", "multipart/related");

    auto headers = assemble_headers(draft, std::string("b"));
    EXPECT_EQ(headers.get("Content-Type").value_or(""), "multipart/related");
}

TEST(AssembleHeaders, NoBoundaryPassThrough) {
    request_draft draft;
    draft.content_type = std::string(MULTIPART_FORM_DATA);
    draft.headers.set("Content-Type", MULTIPART_FORM_DATA);

    auto headers = assemble_headers(draft, std::nullopt);
    EXPECT_EQ(headers.get("Content-Type").value_or(""), "multipart/form-data");
}

TEST(AssembleRequest, GetCarriesQueryStringAndDefaults) {
    auto draft = get_draft("/search");
    draft.params["q"] = {"c++"};
    draft.is_secure = true;

    auto req = assemble_request(std::move(draft), resolved_body{});

    EXPECT_EQ(req.http_method, method::get);
    EXPECT_EQ(req.uri, "/search?q=c%2B%2B");
    EXPECT_EQ(req.query_string, "q=c%2B%2B");
    EXPECT_TRUE(req.body.empty());
    EXPECT_FALSE(req.content_length.has_value());
    EXPECT_TRUE(req.is_secure);
    ASSERT_EQ(req.params.count("q"), 1u);
    EXPECT_EQ(req.params.at("q").front(), "c++");

    EXPECT_EQ(req.server_name, "localhost");
    EXPECT_EQ(req.server_port, 80);
    EXPECT_EQ(req.remote_addr, "127.0.0.1");
    EXPECT_EQ(req.remote_port, 80);
    EXPECT_EQ(req.local_addr, "127.0.0.1");
    EXPECT_EQ(req.local_port, 80);
    EXPECT_EQ(req.local_hostname, "localhost");
    EXPECT_EQ(req.version, (http_version{1, 1}));
    EXPECT_TRUE(req.context_path.empty());
    EXPECT_TRUE(req.path_info.empty());
    EXPECT_TRUE(req.snaplet_path.empty());
}

TEST(AssembleRequest, GetWithoutParamsHasEmptyQueryString) {
    auto req = assemble_request(get_draft("/"), resolved_body{});
    EXPECT_EQ(req.uri, "/");
    EXPECT_TRUE(req.query_string.empty());
}

TEST(AssembleRequest, PostKeepsParamsButNoQueryString) {
    request_draft draft;
    draft.http_method = method::post;
    draft.uri = "/login";
    draft.params["user"] = {"bob"};

    resolved_body body;
    body.body = "user=bob";
    body.content_length = 8;

    auto req = assemble_request(std::move(draft), std::move(body));
    EXPECT_EQ(req.uri, "/login");
    EXPECT_TRUE(req.query_string.empty());
    EXPECT_EQ(req.body, "user=bob");
    EXPECT_EQ(req.content_length, 8u);
    EXPECT_EQ(req.param("user").value_or(""), "bob");
}

TEST(AssembleRequest, CustomDefaults) {
    request_defaults defaults;
    defaults.server_name = "api.internal";
    defaults.server_port = 8443;
    defaults.remote_addr = "10.1.2.3";
    defaults.version = {1, 0};
    defaults.context_path = "/app/";

    auto req = assemble_request(get_draft("/x"), resolved_body{}, defaults);
    EXPECT_EQ(req.server_name, "api.internal");
    EXPECT_EQ(req.server_port, 8443);
    EXPECT_EQ(req.remote_addr, "10.1.2.3");
    EXPECT_EQ(req.version, (http_version{1, 0}));
    EXPECT_EQ(req.context_path, "/app/");
}
