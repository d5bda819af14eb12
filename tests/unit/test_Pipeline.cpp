#include <gtest/gtest.h>
#include "preview/thumbnail/Pipeline.hpp"
#include "util/files.hpp"
#include "TestImages.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace cc;
using namespace cc::preview;
using namespace cc::preview::thumbnail;
using namespace cc::types;

namespace {

class CountingEngine : public image::StbEngine {
public:
    std::atomic<int> decodes{0};

    image::Image decode(const fs::path& path, const std::string& mime) override {
        ++decodes;
        return StbEngine::decode(path, mime);
    }
};

class FailingTranscoder : public webp::Transcoder {
public:
    void convert(const fs::path&, const fs::path&, const webp::Options&) override {
        throw webp::TranscodeError("encoder unavailable");
    }
};

class BrokenEncoderEngine : public image::StbEngine {
public:
    void encode(const image::Canvas& canvas, const fs::path& path, const std::string& mime, int q) override {
        StbEngine::encode(canvas, path, mime, q); // leave a real temp file behind
        throw std::runtime_error("disk full");
    }
};

// Names the file it was given, so each failure is traceable to its request.
class NamingFailTranscoder : public webp::Transcoder {
public:
    void convert(const fs::path& src, const fs::path&, const webp::Options&) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        throw webp::TranscodeError("cannot encode " + src.filename().string());
    }
};

// While the first request is mid-transcode, records what the cache shows and
// starts a second request for the same key.
class InterleavingTranscoder : public webp::Transcoder {
public:
    Pipeline* pipeline = nullptr;
    fs::path source;
    std::optional<fs::path> visibleDuringConvert;
    std::thread other;
    Result otherResult;

    void convert(const fs::path&, const fs::path& dst, const webp::Options&) override {
        if (!other.joinable()) {
            visibleDuringConvert = pipeline->store().lookup(cache::Key::derive(source, 50, 50),
                                                            cache::Format::Jpeg, true);
            other = std::thread([this] { otherResult = pipeline->make(source, 50, 50); });
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        util::writeFile(dst, {'R', 'I', 'F', 'F'});
    }
};

std::string mimeByExtension(const std::string& path) {
    const auto ext = fs::path(path).extension();
    if (ext == ".jpg" || ext == ".jpeg") return cache::MIME_JPEG;
    if (ext == ".png") return cache::MIME_PNG;
    return "text/plain";
}

}

class PipelineTest : public ::testing::Test {
protected:
    fs::path test_dir, cache_dir;
    std::shared_ptr<CountingEngine> engine;

    void SetUp() override {
        test_dir = test::makeScratchDir("cropcache_pipeline");
        cache_dir = test_dir / "cache";
        engine = std::make_shared<CountingEngine>();
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::unique_ptr<Pipeline> makePipeline(const bool webp = false,
                                           std::shared_ptr<webp::Transcoder> transcoder =
                                               std::make_shared<webp::LibWebpTranscoder>()) {
        PipelineOptions opts;
        opts.cachePath = cache_dir;
        opts.webp = webp;
        return std::make_unique<Pipeline>(opts, engine, std::move(transcoder), mimeByExtension);
    }

    fs::path jpegSource(const std::string& name, const int w = 400, const int h = 300) const {
        const auto path = test_dir / name;
        test::writeJpeg(path, w, h);
        return path;
    }
};

TEST_F(PipelineTest, MissThenHitDecodesOnce) {
    auto pipeline = makePipeline();
    const auto src = jpegSource("Holiday.jpg");

    const auto first = pipeline->make(src, 100);
    ASSERT_TRUE(first.ok()) << first.message;
    EXPECT_FALSE(first.cacheHit);
    EXPECT_TRUE(fs::exists(*first.path));
    EXPECT_EQ(first.path->parent_path(), cache_dir);
    EXPECT_EQ(first.path->filename().string(), cache::Key::derive(src, 100).str() + ".jpg");

    const auto second = pipeline->make(src, 100);
    ASSERT_TRUE(second.ok());
    EXPECT_TRUE(second.cacheHit);
    EXPECT_EQ(*second.path, *first.path);
    EXPECT_EQ(engine->decodes.load(), 1);
}

TEST_F(PipelineTest, OutputHasRequestedDimensions) {
    auto pipeline = makePipeline();
    const auto src = jpegSource("wide.jpg", 400, 300);

    const auto boxed = pipeline->make(src, 200, 100);
    ASSERT_TRUE(boxed.ok()) << boxed.message;
    const auto img = engine->decode(*boxed.path, cache::MIME_JPEG);
    EXPECT_EQ(img.width, 200);
    EXPECT_EQ(img.height, 100);

    const auto derived = pipeline->make(src, 80);
    ASSERT_TRUE(derived.ok());
    const auto img2 = engine->decode(*derived.path, cache::MIME_JPEG);
    EXPECT_EQ(img2.width, 80);
    EXPECT_EQ(img2.height, 60);
}

TEST_F(PipelineTest, EachSizeIsItsOwnEntry) {
    auto pipeline = makePipeline();
    const auto src = jpegSource("cat.jpg");

    const auto a = pipeline->make(src, 100);
    const auto b = pipeline->make(src, 100, 100);
    const auto c = pipeline->make(src, 50, 100);

    ASSERT_TRUE(a.ok() && b.ok() && c.ok());
    EXPECT_NE(*a.path, *b.path);
    EXPECT_NE(*b.path, *c.path);
    EXPECT_EQ(pipeline->store().entries().size(), 3u);
}

TEST_F(PipelineTest, MissingSourceIsNotFound) {
    auto pipeline = makePipeline();
    const auto res = pipeline->make(test_dir / "nope.jpg", 100);

    EXPECT_FALSE(res.ok());
    EXPECT_EQ(res.error, Error::SourceNotFound);
    EXPECT_EQ(res.message, "Image not found");
    EXPECT_EQ(engine->decodes.load(), 0);
}

TEST_F(PipelineTest, NonImageIsUnsupported) {
    auto pipeline = makePipeline();
    const auto src = test_dir / "notes.txt";
    std::ofstream(src) << "just text";

    const auto res = pipeline->make(src, 100);
    EXPECT_FALSE(res.ok());
    EXPECT_EQ(res.error, Error::UnsupportedMediaType);
    EXPECT_EQ(res.message, "Not a valid JPG or PNG image");
    EXPECT_TRUE(pipeline->store().entries().empty());
}

TEST_F(PipelineTest, ContentSniffingRejectsRenamedText) {
    PipelineOptions opts;
    opts.cachePath = cache_dir;
    Pipeline pipeline(opts, engine); // libmagic resolver

    const auto src = test_dir / "fake.jpg";
    std::ofstream(src) << "this is plain text pretending to be a photo\n";

    const auto res = pipeline.make(src, 100);
    EXPECT_EQ(res.error, Error::UnsupportedMediaType);
}

TEST_F(PipelineTest, NonPositiveDimensionsAreRejected) {
    auto pipeline = makePipeline();
    const auto src = jpegSource("cat.jpg");

    EXPECT_EQ(pipeline->make(src, 0).error, Error::InvalidDimensions);
    EXPECT_EQ(pipeline->make(src, 100, -1).error, Error::InvalidDimensions);
}

TEST_F(PipelineTest, UndecodableSourceThrowsAndCachesNothing) {
    auto pipeline = makePipeline();
    const auto src = test_dir / "broken.jpg";
    util::writeFile(src, {0xFF, 0xD8, 0x00, 0x01});

    try {
        pipeline->make(src, 100);
        FAIL() << "expected ThumbnailError";
    } catch (const ThumbnailError& e) {
        EXPECT_EQ(e.kind(), Error::DecodeFailed);
    }

    EXPECT_EQ(fs::directory_iterator(cache_dir), fs::directory_iterator{});
}

TEST_F(PipelineTest, EncodeFailureThrowsAndLeavesNoTempFile) {
    PipelineOptions opts;
    opts.cachePath = cache_dir;
    Pipeline pipeline(opts, std::make_shared<BrokenEncoderEngine>(),
                      std::make_shared<FailingTranscoder>(), mimeByExtension);

    try {
        pipeline.make(jpegSource("cat.jpg"), 100);
        FAIL() << "expected ThumbnailError";
    } catch (const ThumbnailError& e) {
        EXPECT_EQ(e.kind(), Error::EncodeOrWriteFailed);
        EXPECT_NE(std::string(e.what()).find("disk full"), std::string::npos);
    }

    EXPECT_EQ(fs::directory_iterator(cache_dir), fs::directory_iterator{});
}

TEST_F(PipelineTest, TranscodeErrorCarriesItsKind) {
    const webp::TranscodeError err("bad");
    EXPECT_EQ(err.kind(), Error::TranscodeFailed);
    EXPECT_EQ(to_string(err.kind()), "transcode_failed");
}

TEST_F(PipelineTest, PngTransparencySurvives) {
    auto pipeline = makePipeline();
    const auto src = test_dir / "logo.png";
    test::writeHalfTransparentPng(src, 80, 40);

    const auto res = pipeline->make(src, 40, 20);
    ASSERT_TRUE(res.ok()) << res.message;
    EXPECT_EQ(res.path->extension(), ".png");

    const auto img = engine->decode(*res.path, cache::MIME_PNG);
    EXPECT_EQ(img.channels, 4);
    EXPECT_LE(test::alphaAt(img, 0, 10), 1);
    EXPECT_GE(test::alphaAt(img, 39, 10), 254);
}

TEST_F(PipelineTest, FlushBySourceLeavesOtherSources) {
    auto pipeline = makePipeline();
    const auto cat = jpegSource("cat.jpg");
    const auto dog = jpegSource("dog.jpg");

    ASSERT_TRUE(pipeline->make(cat, 100).ok());
    ASSERT_TRUE(pipeline->make(cat, 50, 50).ok());
    const auto dogThumb = pipeline->make(dog, 100);
    ASSERT_TRUE(dogThumb.ok());

    EXPECT_EQ(pipeline->flush(cat), 2u);
    EXPECT_TRUE(fs::exists(*dogThumb.path));

    // regenerated after flush
    const auto again = pipeline->make(cat, 100);
    EXPECT_FALSE(again.cacheHit);

    EXPECT_EQ(pipeline->flush(), 2u);
    EXPECT_TRUE(pipeline->store().entries().empty());
}

TEST_F(PipelineTest, WebpOutputReplacesNativeEntry) {
    auto pipeline = makePipeline(true);
    const auto src = jpegSource("cat.jpg");

    const auto res = pipeline->make(src, 100, 100);
    ASSERT_TRUE(res.ok()) << res.message;
    EXPECT_EQ(res.path->extension(), ".webp");
    EXPECT_FALSE(res.transcodeError.has_value());
    EXPECT_FALSE(fs::exists(pipeline->store().pathFor(cache::Key::derive(src, 100, 100), cache::Format::Jpeg)));

    const auto hit = pipeline->make(src, 100, 100);
    EXPECT_TRUE(hit.cacheHit);
    EXPECT_EQ(*hit.path, *res.path);
    EXPECT_EQ(engine->decodes.load(), 1);
}

TEST_F(PipelineTest, FailedTranscodeKeepsNativeFile) {
    auto pipeline = makePipeline(true, std::make_shared<FailingTranscoder>());
    const auto src = jpegSource("cat.jpg");

    const auto res = pipeline->make(src, 100);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.path->extension(), ".jpg");
    EXPECT_TRUE(fs::exists(*res.path));
    EXPECT_EQ(res.transcodeError, "encoder unavailable");
    EXPECT_EQ(pipeline->lastTranscodeError(), "encoder unavailable");

    // no stray temp files
    EXPECT_EQ(pipeline->store().entries().size(), 1u);
    EXPECT_EQ(std::distance(fs::directory_iterator(cache_dir), fs::directory_iterator{}), 1);

    // the native entry is served on the next call
    const auto hit = pipeline->make(src, 100);
    EXPECT_TRUE(hit.cacheHit);
    EXPECT_EQ(*hit.path, *res.path);
}

TEST_F(PipelineTest, SameKeyCallerDuringTranscodeGetsFinalEntry) {
    const auto transcoder = std::make_shared<InterleavingTranscoder>();
    auto pipeline = makePipeline(true, transcoder);
    const auto src = jpegSource("cat.jpg");
    transcoder->pipeline = pipeline.get();
    transcoder->source = src;

    const auto first = pipeline->make(src, 50, 50);
    if (transcoder->other.joinable()) transcoder->other.join();

    ASSERT_TRUE(first.ok()) << first.message;
    EXPECT_EQ(first.path->extension(), ".webp");
    EXPECT_FALSE(transcoder->visibleDuringConvert.has_value());

    const auto& second = transcoder->otherResult;
    ASSERT_TRUE(second.ok()) << second.message;
    EXPECT_TRUE(second.cacheHit);
    EXPECT_EQ(*second.path, *first.path);
    EXPECT_TRUE(fs::exists(*second.path));

    EXPECT_EQ(engine->decodes.load(), 1);
    EXPECT_EQ(std::distance(fs::directory_iterator(cache_dir), fs::directory_iterator{}), 1);
}

TEST_F(PipelineTest, ConcurrentTranscodeFailuresKeepTheirOwnMessage) {
    auto pipeline = makePipeline(true, std::make_shared<NamingFailTranscoder>());
    const auto cat = jpegSource("cat.jpg");
    const auto dog = jpegSource("dog.jpg");

    Result catRes, dogRes;
    std::thread a([&] { catRes = pipeline->make(cat, 64); });
    std::thread b([&] { dogRes = pipeline->make(dog, 64); });
    a.join();
    b.join();

    ASSERT_TRUE(catRes.transcodeError.has_value());
    ASSERT_TRUE(dogRes.transcodeError.has_value());
    EXPECT_NE(catRes.transcodeError->find(cache::Key::derive(cat, 64).str()), std::string::npos);
    EXPECT_NE(dogRes.transcodeError->find(cache::Key::derive(dog, 64).str()), std::string::npos);
    EXPECT_TRUE(fs::exists(*catRes.path));
    EXPECT_TRUE(fs::exists(*dogRes.path));
}

TEST_F(PipelineTest, ToWebPKeepsOriginalWhenAsked) {
    auto pipeline = makePipeline();
    const auto src = jpegSource("cat.jpg", 64, 64);

    const auto out = pipeline->toWebP(src, false);
    EXPECT_EQ(out, test_dir / "cat.webp");
    EXPECT_TRUE(fs::exists(out));
    EXPECT_TRUE(fs::exists(src));

    const auto moved = pipeline->toWebP(jpegSource("dog.jpg", 64, 64));
    EXPECT_EQ(moved, test_dir / "dog.webp");
    EXPECT_FALSE(fs::exists(test_dir / "dog.jpg"));
}

TEST_F(PipelineTest, ConcurrentMissesGenerateOnce) {
    auto pipeline = makePipeline();
    const auto src = jpegSource("busy.jpg", 800, 600);

    std::vector<std::thread> threads;
    std::vector<Result> results(8);
    for (size_t i = 0; i < results.size(); ++i)
        threads.emplace_back([&, i] { results[i] = pipeline->make(src, 120, 90); });
    for (auto& t : threads) t.join();

    EXPECT_EQ(engine->decodes.load(), 1);
    for (const auto& r : results) {
        ASSERT_TRUE(r.ok()) << r.message;
        EXPECT_EQ(*r.path, *results.front().path);
    }
    EXPECT_EQ(pipeline->store().entries().size(), 1u);
}

TEST_F(PipelineTest, OptionsAreClampedAndReadFromConfig) {
    config::CachingConfig cnf;
    cnf.path = cache_dir;
    cnf.thumbnails.jpeg_quality = 500;
    cnf.thumbnails.png_compression = 0;
    cnf.thumbnails.webp = true;

    Pipeline pipeline(PipelineOptions::fromConfig(cnf), engine);
    EXPECT_EQ(pipeline.options().jpegQuality, 100);
    EXPECT_EQ(pipeline.options().pngCompression, 1);
    EXPECT_TRUE(pipeline.options().webp);
    EXPECT_EQ(pipeline.store().root(), cache_dir);
}
