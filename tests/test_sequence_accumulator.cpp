#include <gtest/gtest.h>
#include "signflow/sequence_accumulator.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace signflow;

class SequenceAccumulatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.capacity = 7;
        config_.alphabet_idle_ms = 1000;
        config_.silence_commit_ms = 2000;
        accumulator_ = std::make_unique<SequenceAccumulator>(config_);
        accumulator_->set_event_sink([this](const GlossEvent& event) { events_.push_back(event); });
    }

    std::vector<SequenceCommitted> sequences() const {
        std::vector<SequenceCommitted> out;
        for (const auto& e : events_) {
            if (const auto* seq = std::get_if<SequenceCommitted>(&e)) out.push_back(*seq);
        }
        return out;
    }

    std::vector<AlphabetWordCommitted> words() const {
        std::vector<AlphabetWordCommitted> out;
        for (const auto& e : events_) {
            if (const auto* word = std::get_if<AlphabetWordCommitted>(&e)) out.push_back(*word);
        }
        return out;
    }

    AccumulatorConfig config_;
    std::unique_ptr<SequenceAccumulator> accumulator_;
    std::vector<GlossEvent> events_;
};

// Test fingerspelled words committed on idle
TEST_F(SequenceAccumulatorTest, AlphabetWordCommitsAfterIdleGap) {
    accumulator_->append("C", 0);
    accumulator_->append("A", 300);
    accumulator_->append("T", 600);
    EXPECT_EQ(accumulator_->snapshot().current_word, "CAT");
    EXPECT_TRUE(accumulator_->snapshot().alphabet_mode);

    accumulator_->tick(1599);
    EXPECT_TRUE(events_.empty());

    accumulator_->tick(1600);
    ASSERT_EQ(words().size(), 1u);
    EXPECT_EQ(words()[0].word, "CAT");

    // The word becomes one main token
    auto snap = accumulator_->snapshot();
    ASSERT_EQ(snap.tokens.size(), 1u);
    EXPECT_EQ(snap.tokens[0], "CAT");
    EXPECT_TRUE(snap.current_word.empty());
}

TEST_F(SequenceAccumulatorTest, AlphabetWordCommitsAtCapacity) {
    const std::string letters = "ABCDEFG";
    for (size_t i = 0; i < letters.size(); ++i) {
        accumulator_->append(std::string(1, letters[i]), static_cast<int64_t>(i) * 100);
        if (i < 6) EXPECT_TRUE(words().empty()) << "letter " << i;
    }
    ASSERT_EQ(words().size(), 1u);
    EXPECT_EQ(words()[0].word, "ABCDEFG");
    EXPECT_EQ(accumulator_->size(), 1u);
}

TEST_F(SequenceAccumulatorTest, NonLetterCommitsPendingWord) {
    accumulator_->append("M", 0);
    accumulator_->append("Y", 100);
    accumulator_->append("HELLO", 200);

    ASSERT_EQ(words().size(), 1u);
    EXPECT_EQ(words()[0].word, "MY");
    auto snap = accumulator_->snapshot();
    ASSERT_EQ(snap.tokens.size(), 2u);
    EXPECT_EQ(snap.tokens[0], "MY");
    EXPECT_EQ(snap.tokens[1], "HELLO");
    EXPECT_EQ(snap.display_text(), "MY HELLO");
}

// Test capacity-driven sequence commits
TEST_F(SequenceAccumulatorTest, SeventhTokenCommitsSequence) {
    std::vector<std::string> glosses = {"I", "WANT", "GO", "STORE", "BUY", "MILK", "NOW"};
    for (size_t i = 0; i < glosses.size(); ++i) {
        accumulator_->append(glosses[i], static_cast<int64_t>(i) * 700);
        if (i < 6) EXPECT_TRUE(sequences().empty()) << "token " << i;
    }
    ASSERT_EQ(sequences().size(), 1u);
    EXPECT_EQ(sequences()[0].tokens, glosses);
    EXPECT_EQ(sequences()[0].timestamp_ms, 6 * 700);
    EXPECT_EQ(accumulator_->size(), 0u);
    EXPECT_EQ(accumulator_->snapshot().state, BufferState::Empty);
}

TEST_F(SequenceAccumulatorTest, NeverExceedsCapacity) {
    config_.capacity = 3;
    accumulator_->set_config(config_);
    for (int i = 0; i < 20; ++i) {
        accumulator_->append("SIGN" + std::to_string(i), i * 700);
        EXPECT_LE(accumulator_->size(), 3u);
    }
    for (const auto& seq : sequences()) EXPECT_EQ(seq.tokens.size(), 3u);
}

// Test user edits
TEST_F(SequenceAccumulatorTest, BackspaceRemovesLastInput) {
    accumulator_->append("HELLO", 0);
    accumulator_->append("N", 100);
    accumulator_->append("A", 200);

    accumulator_->backspace();
    EXPECT_EQ(accumulator_->snapshot().current_word, "N");
    accumulator_->backspace();
    EXPECT_TRUE(accumulator_->snapshot().current_word.empty());
    EXPECT_EQ(accumulator_->size(), 1u);
    accumulator_->backspace();
    EXPECT_EQ(accumulator_->size(), 0u);

    // Backspace on an empty buffer does nothing
    accumulator_->backspace();
    EXPECT_EQ(accumulator_->snapshot().state, BufferState::Empty);
    EXPECT_TRUE(events_.empty());
}

TEST_F(SequenceAccumulatorTest, ClearDiscardsWithoutEvents) {
    accumulator_->append("HELLO", 0);
    accumulator_->append("Q", 100);
    accumulator_->clear();
    EXPECT_EQ(accumulator_->snapshot().state, BufferState::Empty);
    accumulator_->tick(10000);
    EXPECT_TRUE(events_.empty());
}

TEST_F(SequenceAccumulatorTest, ManualCommitFlushesWordAndTokens) {
    accumulator_->append("HELLO", 0);
    accumulator_->append("B", 100);
    accumulator_->append("O", 200);
    accumulator_->append("B", 300);

    auto tokens = accumulator_->commit(400);
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[1], "BOB");
    ASSERT_EQ(words().size(), 1u);
    ASSERT_EQ(sequences().size(), 1u);

    // Word event precedes the sequence that contains it
    EXPECT_TRUE(std::holds_alternative<AlphabetWordCommitted>(events_[0]));
    EXPECT_TRUE(std::holds_alternative<SequenceCommitted>(events_[1]));

    EXPECT_TRUE(accumulator_->commit(500).empty());
    EXPECT_EQ(events_.size(), 2u);
}

// Test the silence timeout
TEST_F(SequenceAccumulatorTest, SilenceCommitsSequence) {
    accumulator_->append("HELLO", 0);
    accumulator_->append("FRIEND", 700);
    accumulator_->tick(2699);
    EXPECT_TRUE(sequences().empty());
    accumulator_->tick(2700);
    ASSERT_EQ(sequences().size(), 1u);
    EXPECT_EQ(sequences()[0].tokens.size(), 2u);
}

TEST_F(SequenceAccumulatorTest, SilenceDisabledWithZero) {
    config_.silence_commit_ms = 0;
    accumulator_->set_config(config_);
    accumulator_->append("HELLO", 0);
    accumulator_->tick(60000);
    EXPECT_TRUE(sequences().empty());
}

// Test metadata carried by the sequence event
TEST_F(SequenceAccumulatorTest, SequenceCarriesOriginAndNonManuals) {
    NonManualAnnotation nod;
    nod.timestamp_ms = 100;
    nod.head_pose = HeadPose::Nod;
    accumulator_->add_nonmanual(nod);
    accumulator_->note_result("FSL", 0.82f);
    accumulator_->append("SALAMAT", 150);
    accumulator_->commit(200);

    ASSERT_EQ(sequences().size(), 1u);
    const SequenceCommitted seq = sequences()[0];
    EXPECT_EQ(seq.origin, "FSL");
    EXPECT_FLOAT_EQ(seq.confidence, 0.82f);
    ASSERT_EQ(seq.nonmanuals.size(), 1u);
    EXPECT_EQ(seq.nonmanuals[0].head_pose, HeadPose::Nod);

    // Metadata does not leak into the next sequence
    accumulator_->append("HELLO", 300);
    accumulator_->commit(400);
    ASSERT_EQ(sequences().size(), 2u);
    EXPECT_EQ(sequences()[1].origin, "UNKNOWN");
    EXPECT_TRUE(sequences()[1].nonmanuals.empty());
}

TEST_F(SequenceAccumulatorTest, DiscardWordKeepsTokens) {
    accumulator_->append("HELLO", 0);
    accumulator_->append("X", 100);
    accumulator_->discard_word();
    auto snap = accumulator_->snapshot();
    EXPECT_TRUE(snap.current_word.empty());
    EXPECT_EQ(snap.tokens.size(), 1u);
    EXPECT_EQ(snap.display_text(), "HELLO");
}

// Appends and user commands from different threads never corrupt the buffer
TEST(SequenceAccumulatorConcurrencyTest, ConcurrentAppendAndCommands) {
    AccumulatorConfig config;
    config.capacity = 7;
    SequenceAccumulator accumulator(config);

    std::atomic<int> committed_tokens{0};
    accumulator.set_event_sink([&](const GlossEvent& event) {
        if (const auto* seq = std::get_if<SequenceCommitted>(&event)) {
            EXPECT_LE(seq->tokens.size(), 7u);
            committed_tokens += static_cast<int>(seq->tokens.size());
        }
    });

    std::thread worker([&] {
        for (int i = 0; i < 500; ++i) accumulator.append("SIGN", i);
    });
    std::thread ui([&] {
        for (int i = 0; i < 200; ++i) {
            accumulator.backspace();
            (void)accumulator.snapshot();
            EXPECT_LE(accumulator.size(), 7u);
        }
    });
    worker.join();
    ui.join();

    EXPECT_LE(accumulator.size(), 7u);
    EXPECT_LE(committed_tokens.load() + static_cast<int>(accumulator.size()), 500);
}
