/**
 * @file test_history.cpp
 * @brief Unit tests for the queue-confined clipboard history
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/ClipboardHistory.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <vector>

using namespace ClipGuard;
using namespace ClipGuard::Clipboard;
using namespace ClipGuard::Testing;

namespace {

Storage::ItemRecord storedText(const std::string& id, const std::string& text, Timestamp createdAt) {
    Storage::ItemRecord record;
    record.id = id;
    record.createdAt = createdAt;
    record.kind = ItemKind::Text;
    record.originalText = text;
    record.sanitizedText = text;
    record.textLength = text.size();
    return record;
}

} // anonymous namespace

class ClipboardHistoryTest : public ::testing::Test {
protected:
    std::unique_ptr<ClipboardHistory> makeHistory(Storage::IItemStore& items, size_t maxItems = 100) {
        return std::make_unique<ClipboardHistory>(queue_, executor_, service_, items, blobs_, logger_,
                                                  HistoryOptions{maxItems});
    }

    void SetUp() override {
        history_ = makeHistory(items_);
    }

    void TearDown() override {
        history_.reset();
        queue_.Shutdown();
    }

    Core::Logger logger_;
    Sanitize::PatternLibrary library_{logger_};
    Sanitize::SanitizationService service_{library_, logger_};
    Dispatch::SerialQueue queue_{"test.history"};
    Dispatch::WorkerPool pool_{2};
    Dispatch::KeyedExecutor executor_{pool_};
    Storage::InMemoryItemStore items_;
    Storage::InMemoryBlobStore blobs_;
    std::unique_ptr<ClipboardHistory> history_;
};

TEST_F(ClipboardHistoryTest, AddTextSanitizesAndPersists) {
    auto id = history_->addText("password: hunter2");
    ASSERT_RESULT_SUCCESS(id);

    auto item = history_->find(id.value());
    ASSERT_RESULT_SUCCESS(item);
    EXPECT_TRUE(item.value().isSanitized());
    EXPECT_EQ(item.value().displayText(), "password: *******");
    EXPECT_EQ(item.value().originalText(), "password: hunter2");

    history_->flush();
    auto stored = items_.get(id.value());
    ASSERT_RESULT_SUCCESS(stored);
    EXPECT_EQ(stored.value().sanitizedText, "password: *******");
}

TEST_F(ClipboardHistoryTest, DuplicateTextKeepsExistingItem) {
    auto first = history_->addText("copied twice");
    auto second = history_->addText("copied twice");
    ASSERT_RESULT_SUCCESS(first);
    ASSERT_RESULT_SUCCESS(second);

    EXPECT_EQ(first.value(), second.value());
    EXPECT_EQ(history_->size().valueOr(0), 1u);
}

TEST_F(ClipboardHistoryTest, SnapshotIsNewestFirst) {
    ASSERT_RESULT_SUCCESS(history_->addText("one"));
    ASSERT_RESULT_SUCCESS(history_->addText("two"));
    ASSERT_RESULT_SUCCESS(history_->addImage(makePixels(64, 7)));

    auto items = history_->snapshot();
    ASSERT_RESULT_SUCCESS(items);
    ASSERT_EQ(items.value().size(), 3u);
    EXPECT_TRUE(items.value()[0].isImage());
    EXPECT_EQ(items.value()[1].originalText(), "two");
    EXPECT_EQ(items.value()[2].originalText(), "one");
}

TEST_F(ClipboardHistoryTest, CapacityDropsOldest) {
    history_ = makeHistory(items_, 3);
    std::vector<ItemId> ids;
    for (int i = 0; i < 5; i++) {
        auto id = history_->addText("entry " + std::to_string(i));
        ASSERT_RESULT_SUCCESS(id);
        ids.push_back(id.value());
    }

    EXPECT_EQ(history_->size().valueOr(0), 3u);
    EXPECT_RESULT_ERROR(history_->find(ids[0]), ErrorCode::ItemNotFound);
    EXPECT_RESULT_ERROR(history_->find(ids[1]), ErrorCode::ItemNotFound);
    ASSERT_RESULT_SUCCESS(history_->find(ids[4]));

    history_->flush();
    EXPECT_EQ(items_.count(Storage::ItemQuery{}).valueOr(0), 3u);
}

TEST_F(ClipboardHistoryTest, SetMaxItemsTrims) {
    for (int i = 0; i < 4; i++) {
        ASSERT_RESULT_SUCCESS(history_->addText("entry " + std::to_string(i)));
    }

    ASSERT_RESULT_SUCCESS(history_->setMaxItems(2));
    EXPECT_EQ(history_->maxItems(), 2u);
    EXPECT_EQ(history_->size().valueOr(0), 2u);

    EXPECT_RESULT_ERROR(history_->setMaxItems(0), ErrorCode::InvalidArgument);
    EXPECT_EQ(history_->maxItems(), 2u);
}

TEST_F(ClipboardHistoryTest, RemoveAndClear) {
    auto text = history_->addText("to remove");
    auto image = history_->addImage(makePixels(32, 1));
    ASSERT_RESULT_SUCCESS(text);
    ASSERT_RESULT_SUCCESS(image);

    ASSERT_RESULT_SUCCESS(history_->remove(text.value()));
    EXPECT_RESULT_ERROR(history_->remove(text.value()), ErrorCode::ItemNotFound);

    ASSERT_RESULT_SUCCESS(history_->clear());
    EXPECT_EQ(history_->size().valueOr(99), 0u);

    history_->flush();
    EXPECT_EQ(items_.count(Storage::ItemQuery{}).valueOr(99), 0u);
}

TEST_F(ClipboardHistoryTest, ReadTextVariants) {
    auto id = history_->addText("password: hunter2");
    ASSERT_RESULT_SUCCESS(id);

    auto original = history_->readText(id.value(), TextVariant::Original);
    auto display = history_->copyText(id.value());
    ASSERT_RESULT_SUCCESS(original);
    ASSERT_RESULT_SUCCESS(display);
    EXPECT_EQ(original.value(), "password: hunter2");
    EXPECT_NE(display.value(), original.value());

    auto image = history_->addImage(makePixels(16, 2));
    ASSERT_RESULT_SUCCESS(image);
    EXPECT_RESULT_ERROR(history_->readText(image.value()), ErrorCode::InvalidArgument);
    EXPECT_RESULT_ERROR(history_->readText("missing"), ErrorCode::ItemNotFound);
}

TEST_F(ClipboardHistoryTest, FailedWriteIsReported) {
    FailingItemStore failing;
    history_ = makeHistory(failing);

    std::mutex mutex;
    std::vector<StatusEvent> events;
    history_->setStatusCallback([&](const StatusEvent& event) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(event);
    });

    auto id = history_->addText("will not persist");
    ASSERT_RESULT_SUCCESS(id);
    history_->flush();

    {
        std::lock_guard<std::mutex> lock(mutex);
        ASSERT_EQ(events.size(), 1u);
        EXPECT_EQ(events[0].code, ErrorCode::StoreWriteFailed);
        EXPECT_EQ(events[0].itemId, id.value());
    }
    EXPECT_EQ(failing.failedPuts.load(), 1u);

    // The in-memory history still has the item
    EXPECT_EQ(history_->size().valueOr(0), 1u);
    history_.reset();
}

TEST_F(ClipboardHistoryTest, CorruptedFrameBecomesUnavailable) {
    Storage::ItemRecord record = storedText("broken", "", WallClock::now());
    record.originalText.reset();
    record.sanitizedText.reset();
    record.compressedOriginal = std::make_shared<const ByteBuffer>(ByteBuffer{'C', 'G', 'Z', '1', 9, 9});
    record.textLength = 100;
    ASSERT_RESULT_SUCCESS(items_.put(record));

    auto restored = history_->restore();
    ASSERT_RESULT_SUCCESS(restored);
    EXPECT_EQ(restored.value(), 1u);

    std::atomic<int> reported{0};
    history_->setStatusCallback([&](const StatusEvent& event) {
        if (event.code == ErrorCode::DecompressionFailed) {
            ++reported;
        }
    });

    EXPECT_RESULT_ERROR(history_->readText("broken"), ErrorCode::DecompressionFailed);
    EXPECT_RESULT_ERROR(history_->readText("broken"), ErrorCode::TextUnavailable);
    EXPECT_EQ(reported.load(), 1);

    auto stats = history_->statistics();
    ASSERT_RESULT_SUCCESS(stats);
    EXPECT_EQ(stats.value().unavailableTexts, 1u);
}

TEST_F(ClipboardHistoryTest, RestoreLoadsNewestRecords) {
    const Timestamp now = WallClock::now();
    ASSERT_RESULT_SUCCESS(items_.put(storedText("old", "old text", now - Hours(2))));
    ASSERT_RESULT_SUCCESS(items_.put(storedText("new", "new text", now - Hours(1))));

    auto restored = history_->restore();
    ASSERT_RESULT_SUCCESS(restored);
    EXPECT_EQ(restored.value(), 2u);

    auto items = history_->snapshot();
    ASSERT_RESULT_SUCCESS(items);
    ASSERT_EQ(items.value().size(), 2u);
    EXPECT_EQ(items.value()[0].id(), "new");

    // A second restore adds nothing
    EXPECT_EQ(history_->restore().valueOr(99), 0u);
}

TEST_F(ClipboardHistoryTest, ItemAddedHookSeesInsertedItem) {
    ItemId seen;
    bool onQueue = false;
    history_->setItemAddedHook([&](const ClipboardItem& item) {
        seen = item.id();
        onQueue = queue_.isCurrent();
    });

    auto id = history_->addText("hooked");
    ASSERT_RESULT_SUCCESS(id);
    EXPECT_EQ(seen, id.value());
    EXPECT_TRUE(onQueue);
}

TEST_F(ClipboardHistoryTest, SearchFindsPersistedText) {
    ASSERT_RESULT_SUCCESS(history_->addText("meeting notes"));
    ASSERT_RESULT_SUCCESS(history_->addText("shopping list"));
    history_->flush();

    Storage::ItemQuery query;
    query.textContains = "notes";
    auto found = history_->search(query);
    ASSERT_RESULT_SUCCESS(found);
    ASSERT_EQ(found.value().size(), 1u);
    EXPECT_EQ(found.value()[0].originalText, "meeting notes");
}

TEST_F(ClipboardHistoryTest, StatisticsCountKinds) {
    ASSERT_RESULT_SUCCESS(history_->addText("password: hunter2"));
    ASSERT_RESULT_SUCCESS(history_->addText("plain"));
    ASSERT_RESULT_SUCCESS(history_->addImage(makePixels(128, 4)));

    auto stats = history_->statistics();
    ASSERT_RESULT_SUCCESS(stats);
    EXPECT_EQ(stats.value().totalItems, 3u);
    EXPECT_EQ(stats.value().textItems, 2u);
    EXPECT_EQ(stats.value().imageItems, 1u);
    EXPECT_EQ(stats.value().sanitizedItems, 1u);
    EXPECT_EQ(stats.value().residentImages, 1u);
    EXPECT_EQ(stats.value().residentImageBytes, 128u);
}

TEST_F(ClipboardHistoryTest, ImageIsStoredWithItsBlob) {
    const ByteBuffer pixels = makePixels(64, 3);
    auto id = history_->addImage(pixels);
    ASSERT_RESULT_SUCCESS(id);
    history_->flush();

    auto item = history_->find(id.value());
    ASSERT_RESULT_SUCCESS(item);
    EXPECT_EQ(item.value().imageState(), ImageState::Resident);
    ASSERT_TRUE(item.value().imageRef().has_value());
    EXPECT_EQ(item.value().imageRef()->key, id.value());

    auto record = items_.get(id.value());
    ASSERT_RESULT_SUCCESS(record);
    ASSERT_TRUE(record.value().imageRef.has_value());
    auto stored = blobs_.load(*record.value().imageRef);
    ASSERT_RESULT_SUCCESS(stored);
    EXPECT_EQ(stored.value(), pixels);
}

TEST_F(ClipboardHistoryTest, ImagesSurviveRestart) {
    const ByteBuffer pixels = makePixels(96, 5);
    auto id = history_->addImage(pixels);
    ASSERT_RESULT_SUCCESS(id);
    ASSERT_RESULT_SUCCESS(history_->addText("after the image"));
    history_->flush();

    history_.reset();
    history_ = makeHistory(items_);
    auto restored = history_->restore();
    ASSERT_RESULT_SUCCESS(restored);
    EXPECT_EQ(restored.value(), 2u);

    auto item = history_->find(id.value());
    ASSERT_RESULT_SUCCESS(item);
    EXPECT_TRUE(item.value().isImage());
    EXPECT_EQ(item.value().imageState(), ImageState::Evicted);
    EXPECT_TRUE(item.value().hasDurableImage());
    EXPECT_EQ(item.value().imageSize(), pixels.size());
}

TEST_F(ClipboardHistoryTest, StoredImageWithoutBlobIsSkipped) {
    Storage::ItemRecord record;
    record.id = "image-without-blob";
    record.createdAt = WallClock::now();
    record.kind = ItemKind::Image;
    record.imageSize = 32;
    ASSERT_RESULT_SUCCESS(items_.put(record));

    auto restored = history_->restore();
    ASSERT_RESULT_SUCCESS(restored);
    EXPECT_EQ(restored.value(), 0u);
    EXPECT_RESULT_ERROR(history_->find("image-without-blob"), ErrorCode::ItemNotFound);
}

TEST_F(ClipboardHistoryTest, MaintenanceExpiresAndCleansOrphans) {
    const Timestamp now = WallClock::now();
    ASSERT_RESULT_SUCCESS(items_.put(storedText("stale", "stale text", now - Hours(48))));
    ASSERT_RESULT_SUCCESS(history_->restore());
    ASSERT_RESULT_SUCCESS(history_->addText("fresh"));

    const ByteBuffer orphan = makePixels(8, 9);
    ASSERT_RESULT_SUCCESS(blobs_.save("orphan-blob", orphan));

    MaintenanceOptions options;
    options.retention = Hours(24);
    auto report = history_->performMaintenance(options);
    ASSERT_RESULT_SUCCESS(report);

    EXPECT_EQ(report.value().expiredItems, 1u);
    EXPECT_EQ(report.value().orphanBlobs, 1u);
    EXPECT_TRUE(report.value().compacted);

    EXPECT_EQ(history_->size().valueOr(0), 1u);
    EXPECT_RESULT_ERROR(items_.get("stale"), ErrorCode::ItemNotFound);
    auto keys = blobs_.list();
    ASSERT_RESULT_SUCCESS(keys);
    EXPECT_TRUE(keys.value().empty());
}

TEST_F(ClipboardHistoryTest, MaintenanceRejectsQueueThread) {
    ErrorCode code = ErrorCode::Success;
    ASSERT_RESULT_SUCCESS(queue_.sync([&] {
        code = history_->performMaintenance(MaintenanceOptions{}).error();
    }));
    EXPECT_EQ(code, ErrorCode::WrongContext);
}

TEST_F(ClipboardHistoryTest, QueueConfinedAccessorsOffQueue) {
    auto id = history_->addText("confined");
    ASSERT_RESULT_SUCCESS(id);

    EXPECT_EQ(history_->itemsOnQueue(), nullptr);
    EXPECT_EQ(history_->findOnQueue(id.value()), nullptr);
    EXPECT_RESULT_ERROR(history_->trimOnQueue(0), ErrorCode::WrongContext);

    ClipboardItem* onQueue = nullptr;
    ASSERT_RESULT_SUCCESS(queue_.sync([&] { onQueue = history_->findOnQueue(id.value()); }));
    EXPECT_NE(onQueue, nullptr);
}
