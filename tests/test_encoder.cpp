/**
 * @file test_encoder.cpp
 * @brief Batch encoding and flattening into [batch, max_len] tensors
 */

#include <gtest/gtest.h>
#include "fastembed/emb/Encoder.hpp"
#include "fastembed/emb/TensorAssembler.hpp"
#include "fastembed/emb/WordPieceTokenizer.hpp"
#include "test_helpers.hpp"

#include <stdexcept>

using namespace fastembed;

namespace {

class ThrowingTokenizer : public Tokenizer {
public:
    EncodedSequence encode(const std::string&, size_t) const override {
        throw std::runtime_error("bad utf-8");
    }
};

// Ignores max_len, so the encoder has to catch it.
class ShortTokenizer : public Tokenizer {
public:
    EncodedSequence encode(const std::string&, size_t) const override {
        return EncodedSequence{{2, 3}, {1, 1}, {0, 0}};
    }
};

std::shared_ptr<WordPieceTokenizer> tiny_tokenizer(const testutil::TempDir& dir) {
    auto p = testutil::write_file(dir.path() / "tokenizer.json", testutil::tokenizer_json());
    auto tok = std::make_shared<WordPieceTokenizer>();
    tok->load_tokenizer_json(p.string());
    return tok;
}

} // namespace

TEST(EncoderTest, EverySequenceHasMaxLenElements) {
    testutil::TempDir dir;
    Encoder enc(tiny_tokenizer(dir), 6);

    auto seqs = enc.encode({"hello world", "", "hello world foo bar a b c c c"});
    ASSERT_EQ(seqs.size(), 3u);
    for (const auto& s : seqs) {
        EXPECT_EQ(s.ids.size(), 6u);
        EXPECT_EQ(s.attention_mask.size(), 6u);
        EXPECT_EQ(s.type_ids.size(), 6u);
    }
    EXPECT_EQ(seqs[0].ids, (std::vector<int64_t>{2, 5, 6, 3, 0, 0}));
}

TEST(EncoderTest, EmptyBatchGivesNoSequences) {
    testutil::TempDir dir;
    Encoder enc(tiny_tokenizer(dir), 6);
    EXPECT_TRUE(enc.encode({}).empty());
}

TEST(EncoderTest, TokenizerFailureBecomesEncodingError) {
    Encoder enc(std::make_shared<ThrowingTokenizer>(), 8);
    try {
        enc.encode({"x"});
        FAIL() << "expected EncodingError";
    } catch (const EncodingError& e) {
        EXPECT_NE(std::string(e.what()).find("bad utf-8"), std::string::npos);
    }
}

TEST(EncoderTest, WrongLengthFromTokenizerIsRejected) {
    Encoder enc(std::make_shared<ShortTokenizer>(), 8);
    EXPECT_THROW(enc.encode({"x"}), EncodingError);
}

TEST(EncoderTest, NullTokenizerIsRejected) {
    EXPECT_THROW(Encoder(nullptr, 8), EncodingError);
}

// ============================================================================
// TensorAssembler
// ============================================================================

TEST(TensorAssemblerTest, ShapesAreBatchByMaxLen) {
    testutil::TempDir dir;
    Encoder enc(tiny_tokenizer(dir), 5);
    auto batch = assemble_batch(enc.encode({"foo", "bar", "hello"}), 5);

    const std::vector<int64_t> shape{3, 5};
    EXPECT_EQ(batch.ids.shape, shape);
    EXPECT_EQ(batch.mask.shape, shape);
    EXPECT_EQ(batch.type_ids.shape, shape);
    EXPECT_TRUE(batch.ids.consistent());
    EXPECT_TRUE(batch.mask.consistent());
    EXPECT_TRUE(batch.type_ids.consistent());
    EXPECT_EQ(batch.batch_size(), 3u);
    EXPECT_EQ(batch.seq_len(), 5u);
}

TEST(TensorAssemblerTest, RowsKeepInputOrder) {
    std::vector<EncodedSequence> seqs = {
        {{2, 7, 3}, {1, 1, 1}, {0, 0, 0}},
        {{2, 3, 0}, {1, 1, 0}, {0, 0, 0}},
    };
    auto batch = assemble_batch(seqs, 3);
    EXPECT_EQ(batch.ids.data, (std::vector<int64_t>{2, 7, 3, 2, 3, 0}));
    EXPECT_EQ(batch.mask.data, (std::vector<int64_t>{1, 1, 1, 1, 1, 0}));
    EXPECT_EQ(batch.type_ids.data, std::vector<int64_t>(6, 0));
}

TEST(TensorAssemblerTest, MismatchedSequenceThrowsShapeError) {
    std::vector<EncodedSequence> seqs = {
        {{2, 7, 3}, {1, 1, 1}, {0, 0, 0}},
        {{2, 3}, {1, 1}, {0, 0}},
    };
    EXPECT_THROW(assemble_batch(seqs, 3), ShapeError);
}

TEST(TensorAssemblerTest, EmptyBatchIsConsistent) {
    auto batch = assemble_batch({}, 4);
    EXPECT_EQ(batch.batch_size(), 0u);
    EXPECT_TRUE(batch.ids.data.empty());
    EXPECT_TRUE(batch.ids.consistent());
}
