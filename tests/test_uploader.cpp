/// @file test_uploader.cpp
/// Unit tests for uploader.hpp: phase ordering, batch isolation and the
/// convenience sources, against a scripted transport.

#include "errors.hpp"
#include "fake_transport.hpp"
#include "graphql_client.hpp"
#include "multipart.hpp"
#include "uploader.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace asset_upload;
using namespace asset_upload::fakes;
using json = nlohmann::json;

namespace {

class UploaderTest : public ::testing::Test {
protected:
    FakeTransport  transport;
    GraphQLClient  client{transport, kTestEndpoint, "shpat_test"};

    StagedUploader makeUploader(UploaderOptions options = UploaderOptions{}) {
        return StagedUploader(client, transport, options);
    }

    static std::string boundaryOf(const HttpRequest& request) {
        HttpResponse view;
        view.headers = request.headers;
        const std::string type = view.header("Content-Type");
        const std::string marker = "boundary=";
        auto pos = type.find(marker);
        return pos == std::string::npos ? "" : type.substr(pos + marker.size());
    }
};

UploadFile file(const std::string& name, std::size_t size, const std::string& mime = "image/jpeg") {
    return UploadFile{std::string(size, 'x'), name, mime, std::nullopt};
}

} // namespace

// ============================================================================
// Single upload
// ============================================================================

TEST_F(UploaderTest, NegotiateTransferRegisterInOrder) {
    transport.staged.push_back(ScriptedReply::json(stagedTargetReply(
        "https://storage.example.com/bucket", "res://abc",
        {{"policy", "p1"}, {"signature", "s1"}})));
    transport.storage.push_back(ScriptedReply{201, ""});
    transport.registration.push_back(ScriptedReply::json(fileCreateReply(
        json::array({{{"id", "R1"}, {"fileStatus", "UPLOADED"}}}))));

    auto uploader = makeUploader();
    const std::string bytes(17408, '\x5A');
    CreatedResource r = uploader.upload(bytes, "a.jpg", "image/jpeg");

    EXPECT_EQ(r.id, "R1");
    EXPECT_EQ(r.status, ResourceStatus::Uploaded);

    ASSERT_EQ(transport.routes.size(), 3u);
    EXPECT_EQ(transport.routes[0], Route::Staged);
    EXPECT_EQ(transport.routes[1], Route::Storage);
    EXPECT_EQ(transport.routes[2], Route::Register);

    // Storage request: multipart body of the exact documented size.
    const HttpRequest& put = transport.requests[1];
    EXPECT_EQ(put.method, "POST");
    EXPECT_EQ(put.url, "https://storage.example.com/bucket");
    const std::string boundary = boundaryOf(put);
    ASSERT_FALSE(boundary.empty());
    const Attachment attachment{bytes, "a.jpg", "image/jpeg"};
    EXPECT_EQ(put.body.size(),
              expectedMultipartSize(boundary, {{"policy", "p1"}, {"signature", "s1"}},
                                    attachment));
    EXPECT_LT(put.body.find("name=\"policy\""), put.body.find("name=\"signature\""));
    EXPECT_LT(put.body.find("name=\"signature\""), put.body.find("name=\"file\""));

    // Registration references the staged resource URL.
    auto input = FakeTransport::variablesOf(transport.requests[2])["files"][0];
    EXPECT_EQ(input["originalSource"], "res://abc");
    EXPECT_EQ(input["contentType"], "IMAGE");
    EXPECT_FALSE(input.contains("alt"));
}

TEST_F(UploaderTest, AltTextIsRegistered) {
    auto uploader = makeUploader();
    auto r = uploader.upload("bytes", "a.jpg", "image/jpeg", std::string("Front view"));

    auto input = FakeTransport::variablesOf(transport.requestsOn(Route::Register)[0])["files"][0];
    EXPECT_EQ(input["alt"], "Front view");
    EXPECT_EQ(r.alt, std::optional<std::string>("Front view"));
}

TEST_F(UploaderTest, GenericFileUsesFileClass) {
    auto uploader = makeUploader();
    uploader.upload("%PDF-1.4", "manual.pdf", "application/pdf");

    auto staged = FakeTransport::variablesOf(transport.requestsOn(Route::Staged)[0])["input"][0];
    EXPECT_EQ(staged["resource"], "FILE");
    auto reg = FakeTransport::variablesOf(transport.requestsOn(Route::Register)[0])["files"][0];
    EXPECT_EQ(reg["contentType"], "FILE");
}

TEST_F(UploaderTest, PutTransferMethod) {
    UploaderOptions options;
    options.transferMethod = "PUT";
    auto uploader = makeUploader(options);
    uploader.upload("bytes", "a.jpg", "image/jpeg");

    auto staged = FakeTransport::variablesOf(transport.requestsOn(Route::Staged)[0])["input"][0];
    EXPECT_EQ(staged["httpMethod"], "PUT");
    EXPECT_EQ(transport.requestsOn(Route::Storage)[0].method, "PUT");
}

TEST_F(UploaderTest, EmptyBytesFailValidationWithoutNetwork) {
    auto uploader = makeUploader();
    EXPECT_THROW(uploader.upload("", "a.jpg", "image/jpeg"), ValidationError);
    EXPECT_THROW(uploader.upload("x", "", "image/jpeg"), ValidationError);
    EXPECT_THROW(uploader.upload("x", "a.jpg", ""), ValidationError);
    EXPECT_TRUE(transport.requests.empty());
}

TEST_F(UploaderTest, StorageRejectionIsTransferError) {
    transport.storage.push_back(ScriptedReply{403, "<Error><Code>AccessDenied</Code></Error>"});
    auto uploader = makeUploader();

    try {
        uploader.upload("bytes", "a.jpg", "image/jpeg");
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.httpStatus(), 403u);
        EXPECT_EQ(e.responseBody(), "<Error><Code>AccessDenied</Code></Error>");
    }
    EXPECT_EQ(transport.count(Route::Register), 0);
}

TEST_F(UploaderTest, StorageUnreachableIsTransferErrorWithoutStatus) {
    transport.storage.push_back(ScriptedReply::transportFailure());
    auto uploader = makeUploader();

    try {
        uploader.upload("bytes", "a.jpg", "image/jpeg");
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.httpStatus(), 0u);
    }
}

TEST_F(UploaderTest, RetryAfterTransferFailureNegotiatesAgain) {
    transport.storage.push_back(ScriptedReply{500, "oops"});
    auto uploader = makeUploader();

    EXPECT_THROW(uploader.upload("bytes", "a.jpg", "image/jpeg"), TransferError);
    auto r = uploader.upload("bytes", "a.jpg", "image/jpeg");

    EXPECT_FALSE(r.id.empty());
    EXPECT_EQ(transport.count(Route::Staged), 2);
    auto storage = transport.requestsOn(Route::Storage);
    ASSERT_EQ(storage.size(), 2u);
    EXPECT_NE(storage[0].url, storage[1].url);
}

TEST_F(UploaderTest, MissingPolicyParametersRejectedBeforeTransfer) {
    transport.staged.push_back(ScriptedReply::json(
        stagedTargetReply("https://storage.example.com/bucket", "res://abc", {})));
    auto uploader = makeUploader();

    EXPECT_THROW(uploader.upload("bytes", "a.jpg", "image/jpeg"), ValidationError);
    EXPECT_EQ(transport.count(Route::Storage), 0);
}

TEST_F(UploaderTest, RegistrationUserErrors) {
    transport.registration.push_back(ScriptedReply::json(fileCreateReply(
        json::array(),
        json::array({{{"field", json::array({"files", "0", "originalSource"})},
                      {"message", "Invalid resource"}}}))));
    auto uploader = makeUploader();

    try {
        uploader.upload("bytes", "a.jpg", "image/jpeg");
        FAIL() << "expected RegistrationError";
    } catch (const RegistrationError& e) {
        ASSERT_EQ(e.messages().size(), 1u);
        EXPECT_EQ(e.messages()[0], "files.0.originalSource: Invalid resource");
    }
}

TEST_F(UploaderTest, RegistrationWithoutFilesIsAnError) {
    transport.registration.push_back(ScriptedReply::json(fileCreateReply(json::array())));
    auto uploader = makeUploader();
    EXPECT_THROW(uploader.upload("bytes", "a.jpg", "image/jpeg"), RegistrationError);
}

TEST_F(UploaderTest, CancelledUploadSendsNothing) {
    CancellationToken cancel;
    cancel.cancel();
    auto uploader = makeUploader();

    EXPECT_THROW(uploader.upload("bytes", "a.jpg", "image/jpeg", std::nullopt, &cancel),
                 OperationCancelled);
    EXPECT_TRUE(transport.requests.empty());
}

// ============================================================================
// Batch
// ============================================================================

TEST_F(UploaderTest, BatchIsolatesNegotiationFailure) {
    transport.staged.push_back(ScriptedReply::automaticReply());
    transport.staged.push_back(ScriptedReply::json({{"data", {{"stagedUploadsCreate", {
        {"stagedTargets", json::array()},
        {"userErrors", json::array({{{"field", json::array({"input"})},
                                     {"message", "Unsupported type"}}})}
    }}}}}));
    transport.staged.push_back(ScriptedReply::automaticReply());

    auto uploader = makeUploader();
    auto result = uploader.uploadBatch({file("one.jpg", 10), file("two.jpg", 20), file("three.jpg", 30)});

    ASSERT_EQ(result.entries.size(), 3u);
    EXPECT_TRUE(result.entries[0].ok());
    EXPECT_FALSE(result.entries[1].ok());
    EXPECT_TRUE(result.entries[2].ok());

    EXPECT_EQ(result.entries[1].filename, "two.jpg");
    EXPECT_EQ(result.entries[1].failedPhase, UploadPhase::Negotiate);
    EXPECT_EQ(result.entries[1].errorKind, ErrorKind::Negotiation);
    EXPECT_NE(result.entries[1].errorMessage.find("Unsupported type"), std::string::npos);

    EXPECT_EQ(result.summary.total, 3);
    EXPECT_EQ(result.summary.succeeded, 2);
    EXPECT_EQ(result.summary.failed, 1);

    EXPECT_EQ(transport.count(Route::Storage), 2);
    ASSERT_EQ(transport.count(Route::Register), 1);
    auto files = FakeTransport::variablesOf(transport.requestsOn(Route::Register)[0])["files"];
    EXPECT_EQ(files.size(), 2u);
}

TEST_F(UploaderTest, BatchValidationFailureSkipsNetwork) {
    auto uploader = makeUploader();
    auto result = uploader.uploadBatch({file("empty.jpg", 0), file("ok.jpg", 5)});

    EXPECT_EQ(result.entries[0].failedPhase, UploadPhase::Validation);
    EXPECT_EQ(result.entries[0].errorKind, ErrorKind::Validation);
    EXPECT_TRUE(result.entries[1].ok());
    EXPECT_EQ(transport.count(Route::Staged), 1);
}

TEST_F(UploaderTest, BatchTransferFailureIsPerFile) {
    transport.storage.push_back(ScriptedReply{201, ""});
    transport.storage.push_back(ScriptedReply{400, "bad policy"});

    auto uploader = makeUploader();
    auto result = uploader.uploadBatch({file("one.jpg", 10), file("two.jpg", 20)});

    EXPECT_TRUE(result.entries[0].ok());
    EXPECT_EQ(result.entries[1].failedPhase, UploadPhase::Transfer);
    EXPECT_EQ(result.entries[1].errorKind, ErrorKind::Transfer);
    EXPECT_STREQ(toString(result.entries[1].errorKind), "TransferError");
}

TEST_F(UploaderTest, BatchRegistrationUserErrorFailsOnlyNamedFile) {
    transport.registration.push_back(ScriptedReply::json(fileCreateReply(
        json::array(),
        json::array({{{"field", json::array({"files", "1", "alt"})},
                      {"message", "Alt is too long"}}}))));

    auto uploader = makeUploader();
    auto result = uploader.uploadBatch(
        {file("one.jpg", 10), file("two.jpg", 20), file("three.jpg", 30)});

    EXPECT_TRUE(result.entries[0].ok());
    EXPECT_TRUE(result.entries[2].ok());
    EXPECT_EQ(result.entries[1].failedPhase, UploadPhase::Register);
    EXPECT_EQ(result.entries[1].errorKind, ErrorKind::Registration);
    EXPECT_NE(result.entries[1].errorMessage.find("files.1.alt: Alt is too long"),
              std::string::npos);
    EXPECT_EQ(result.summary.succeeded, 2);
    EXPECT_EQ(result.summary.failed, 1);

    // The siblings are registered again without the rejected file.
    ASSERT_EQ(transport.count(Route::Register), 2);
    auto first  = FakeTransport::variablesOf(transport.requestsOn(Route::Register)[0])["files"];
    auto second = FakeTransport::variablesOf(transport.requestsOn(Route::Register)[1])["files"];
    EXPECT_EQ(first.size(), 3u);
    ASSERT_EQ(second.size(), 2u);
    EXPECT_EQ(second[0]["originalSource"], first[0]["originalSource"]);
    EXPECT_EQ(second[1]["originalSource"], first[2]["originalSource"]);
}

TEST_F(UploaderTest, BatchRegistrationUnattributedUserErrorFailsEveryPendingFile) {
    transport.registration.push_back(ScriptedReply::json(fileCreateReply(
        json::array(),
        json::array({{{"field", nullptr}, {"message", "Quota exceeded"}}}))));

    auto uploader = makeUploader();
    auto result = uploader.uploadBatch({file("one.jpg", 10), file("two.jpg", 20)});

    EXPECT_EQ(result.summary.failed, 2);
    for (const auto& entry : result.entries) {
        EXPECT_EQ(entry.failedPhase, UploadPhase::Register);
        EXPECT_EQ(entry.errorKind, ErrorKind::Registration);
        EXPECT_NE(entry.errorMessage.find("Quota exceeded"), std::string::npos);
    }
    EXPECT_EQ(transport.count(Route::Register), 1);
}

TEST_F(UploaderTest, BatchFileCountMismatchFailsPendingFiles) {
    transport.registration.push_back(ScriptedReply::json(fileCreateReply(
        json::array({{{"id", "R1"}, {"fileStatus", "UPLOADED"}}}))));

    auto uploader = makeUploader();
    auto result = uploader.uploadBatch({file("one.jpg", 10), file("two.jpg", 20)});

    EXPECT_EQ(result.summary.succeeded, 0);
    EXPECT_EQ(result.summary.failed, 2);
}

TEST_F(UploaderTest, BatchRegistrationTransportFailure) {
    transport.registration.push_back(ScriptedReply::transportFailure());

    auto uploader = makeUploader();
    auto result = uploader.uploadBatch({file("one.jpg", 10)});

    EXPECT_EQ(result.entries[0].failedPhase, UploadPhase::Register);
    EXPECT_EQ(result.entries[0].errorKind, ErrorKind::Registration);
}

TEST_F(UploaderTest, UnbatchedRegistrationCallsOncePerFile) {
    UploaderOptions options;
    options.batchRegistration = false;
    transport.registration.push_back(ScriptedReply::automaticReply());
    transport.registration.push_back(ScriptedReply::json(fileCreateReply(
        json::array(),
        json::array({{{"field", json::array({"files", "0"})}, {"message", "Duplicate"}}}))));

    auto uploader = makeUploader(options);
    auto result = uploader.uploadBatch({file("one.jpg", 10), file("two.jpg", 20)});

    EXPECT_EQ(transport.count(Route::Register), 2);
    EXPECT_TRUE(result.entries[0].ok());
    EXPECT_FALSE(result.entries[1].ok());
    EXPECT_NE(result.entries[1].errorMessage.find("Duplicate"), std::string::npos);
}

TEST_F(UploaderTest, EmptyBatch) {
    auto uploader = makeUploader();
    auto result = uploader.uploadBatch({});

    EXPECT_TRUE(result.entries.empty());
    EXPECT_EQ(result.summary.total, 0);
    EXPECT_TRUE(transport.requests.empty());
}

TEST_F(UploaderTest, CancelledBatchThrows) {
    CancellationToken cancel;
    cancel.cancel();
    auto uploader = makeUploader();

    EXPECT_THROW(uploader.uploadBatch({file("one.jpg", 10)}, &cancel), OperationCancelled);
}

// ============================================================================
// Convenience sources
// ============================================================================

TEST_F(UploaderTest, UploadFileReadsBytesAndGuessesMime) {
    const std::string path = ::testing::TempDir() + "asset_upload_photo.png";
    {
        std::ofstream out(path, std::ios::binary);
        out << std::string("\x89PNG\r\n\x1a\n", 8) << "pixels";
    }

    auto uploader = makeUploader();
    auto r = uploader.uploadFile(path);
    std::remove(path.c_str());

    EXPECT_FALSE(r.id.empty());
    auto staged = FakeTransport::variablesOf(transport.requestsOn(Route::Staged)[0])["input"][0];
    EXPECT_EQ(staged["filename"], "asset_upload_photo.png");
    EXPECT_EQ(staged["mimeType"], "image/png");
    EXPECT_EQ(staged["fileSize"], "14");
}

TEST_F(UploaderTest, UploadFileMissingPath) {
    auto uploader = makeUploader();
    EXPECT_THROW(uploader.uploadFile(::testing::TempDir() + "does/not/exist.jpg"),
                 ValidationError);
    EXPECT_TRUE(transport.requests.empty());
}

TEST_F(UploaderTest, BatchReportsUnreadableFileByPath) {
    const std::string good = ::testing::TempDir() + "asset_upload_batch.jpg";
    {
        std::ofstream out(good, std::ios::binary);
        out << "jpeg-bytes";
    }
    const std::string missing = ::testing::TempDir() + "no/such/dir/gone.jpg";

    auto uploader = makeUploader();
    auto result = uploader.uploadBatch({loadUploadFile(good), loadUploadFile(missing)});
    std::remove(good.c_str());

    EXPECT_TRUE(result.entries[0].ok());
    EXPECT_EQ(result.entries[1].filename, "gone.jpg");
    EXPECT_EQ(result.entries[1].failedPhase, UploadPhase::Validation);
    EXPECT_EQ(result.entries[1].errorMessage, "Cannot open file: " + missing);
    EXPECT_EQ(transport.count(Route::Staged), 1);
}

TEST_F(UploaderTest, UploadFromStreamReadsEverything) {
    std::istringstream in(std::string(2048, 'z'));

    auto uploader = makeUploader();
    auto r = uploader.upload(in, "stream.jpg", "image/jpeg", std::string("From stream"));

    EXPECT_FALSE(r.id.empty());
    auto staged = FakeTransport::variablesOf(transport.requestsOn(Route::Staged)[0])["input"][0];
    EXPECT_EQ(staged["fileSize"], "2048");
    auto registered = FakeTransport::variablesOf(transport.requestsOn(Route::Register)[0])["files"][0];
    EXPECT_EQ(registered["alt"], "From stream");
}

TEST_F(UploaderTest, UploadFromEmptyStreamIsValidationError) {
    std::istringstream in;
    auto uploader = makeUploader();

    EXPECT_THROW(uploader.upload(in, "empty.jpg", "image/jpeg"), ValidationError);
    EXPECT_TRUE(transport.requests.empty());
}

TEST_F(UploaderTest, UploadFromBrokenStreamIsValidationError) {
    std::istringstream in("bytes");
    in.setstate(std::ios::badbit);
    auto uploader = makeUploader();

    EXPECT_THROW(uploader.upload(in, "broken.jpg", "image/jpeg"), ValidationError);
    EXPECT_TRUE(transport.requests.empty());
}

TEST_F(UploaderTest, UploadFromUrlDownloadsThenUploads) {
    transport.storage.push_back(ScriptedReply{200, "remote-image-bytes"});

    auto uploader = makeUploader();
    auto r = uploader.uploadFromUrl("https://images.example.org/cat.jpg", "cat.jpg",
                                    "image/jpeg", std::nullopt,
                                    std::string("asset-test/1.0"));

    EXPECT_FALSE(r.id.empty());
    ASSERT_EQ(transport.routes.size(), 4u);
    const HttpRequest& download = transport.requests[0];
    EXPECT_EQ(download.method, "GET");
    EXPECT_EQ(download.url, "https://images.example.org/cat.jpg");
    HttpResponse view;
    view.headers = download.headers;
    EXPECT_EQ(view.header("User-Agent"), "asset-test/1.0");

    auto staged = FakeTransport::variablesOf(transport.requestsOn(Route::Staged)[0])["input"][0];
    EXPECT_EQ(staged["fileSize"], "18");
}

TEST_F(UploaderTest, UploadFromUrlDownloadFailure) {
    transport.storage.push_back(ScriptedReply{404, "not found"});
    auto uploader = makeUploader();

    EXPECT_THROW(uploader.uploadFromUrl("https://images.example.org/gone.jpg", "gone.jpg",
                                        "image/jpeg"),
                 ValidationError);
    EXPECT_EQ(transport.count(Route::Staged), 0);
}

TEST(BaseName, StripsDirectories) {
    EXPECT_EQ(baseName("dir/sub/a.jpg"), "a.jpg");
    EXPECT_EQ(baseName("C:\\pics\\b.png"), "b.png");
    EXPECT_EQ(baseName("c.gif"), "c.gif");
}
