/**
 * @file test_position_allocator.cpp
 * @brief Unit tests for PositionAllocator
 *
 * Tests cover:
 * 1. First slot at the top-right anchor or a configured default position
 * 2. Vertical stacking spaced by surface height + gap
 * 3. Wrapping into a new column when the screen bottom is reached
 * 4. Restart at the anchor when no column is left
 * 5. Keeping wider notes inside the right edge
 * 6. Giving back a slot whose surface never appeared
 */

#include <QTest>

#include "position_allocator.h"

namespace
{

constexpr ui::WindowDimension SCREEN{.height = 1080, .width = 1920};
constexpr ui::WindowDimension NOTE{.height = 50, .width = 200};

} // anonymous namespace

class TestPositionAllocator : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void firstSlot_defaultsToTopRightCorner()
    {
        PositionAllocator allocator(PlacementSettings{});
        const auto position = allocator.next_position(SCREEN, NOTE);

        QCOMPARE(position.x, 1920 - 200 - 20);
        QCOMPARE(position.y, 20);
    }

    void firstSlot_usesConfiguredAnchor()
    {
        PositionAllocator allocator(
            PlacementSettings{.anchor = ui::ScreenCoord{100, 40}});
        const auto position = allocator.next_position(SCREEN, NOTE);

        QCOMPARE(position.x, 100);
        QCOMPARE(position.y, 40);
    }

    void firstSlot_clampsToLeftEdgeOnNarrowScreens()
    {
        PositionAllocator allocator(PlacementSettings{});
        const auto position = allocator.next_position(
            ui::WindowDimension{.height = 600, .width = 150}, NOTE);

        QCOMPARE(position.x, 0);
    }

    void sequentialSlots_areSpacedByHeightPlusGap()
    {
        PlacementSettings settings;
        settings.gap = 10;
        PositionAllocator allocator(settings);

        int previous_y = -1;
        for (int i = 0; i < 8; ++i) {
            const auto position = allocator.next_position(SCREEN, NOTE);
            QCOMPARE(position.x, 1920 - 200 - 20);
            if (previous_y >= 0) {
                QVERIFY(position.y > previous_y);
                QCOMPARE(position.y - previous_y,
                         static_cast<int>(NOTE.height) + 10);
            }
            previous_y = position.y;
        }
    }

    void sequentialSlots_followTheLastSurfaceHeight()
    {
        PositionAllocator allocator(PlacementSettings{});
        const auto first = allocator.next_position(
            SCREEN, ui::WindowDimension{.height = 120, .width = 200});
        const auto second = allocator.next_position(SCREEN, NOTE);

        QCOMPARE(second.y, first.y + 120 + 10);
    }

    void overflow_wrapsIntoColumnToTheLeft()
    {
        const ui::WindowDimension screen{.height = 200, .width = 1000};
        PositionAllocator allocator(PlacementSettings{});

        const auto first = allocator.next_position(screen, NOTE);   // y=20
        const auto second = allocator.next_position(screen, NOTE);  // y=80
        const auto third = allocator.next_position(screen, NOTE);   // y=140
        QCOMPARE(second.y, 80);
        QCOMPARE(third.y, 140);

        // 200 would end at 250 > 200
        const auto fourth = allocator.next_position(screen, NOTE);
        QCOMPARE(fourth.x, first.x - 200 - 10);
        QCOMPARE(fourth.y, first.y);

        const auto fifth = allocator.next_position(screen, NOTE);
        QCOMPARE(fifth.x, fourth.x);
        QCOMPARE(fifth.y, fourth.y + 60);
    }

    void overflow_restartsAtAnchorWhenColumnsRunOut()
    {
        const ui::WindowDimension screen{.height = 100, .width = 300};
        PositionAllocator allocator(PlacementSettings{});

        const auto first = allocator.next_position(screen, NOTE);
        QCOMPARE(first.x, 80);
        QCOMPARE(first.y, 20);

        // Next column would start at x = 80 - 210 < 0
        const auto second = allocator.next_position(screen, NOTE);
        QCOMPARE(second.x, first.x);
        QCOMPARE(second.y, first.y);
    }

    void stackedWiderNote_staysOnScreen()
    {
        PositionAllocator allocator(PlacementSettings{});
        const ui::WindowDimension wide{.height = 50, .width = 800};

        const auto first = allocator.next_position(SCREEN, NOTE);
        QCOMPARE(first.x, 1700);

        const auto second = allocator.next_position(SCREEN, wide);
        QCOMPARE(second.x + 800, 1920 - 20);
        QCOMPARE(second.y, first.y + 50 + 10);

        // A narrow note below keeps the column of the wide one
        const auto third = allocator.next_position(SCREEN, NOTE);
        QCOMPARE(third.x, second.x);
        QCOMPARE(third.y, second.y + 50 + 10);
    }

    void stackedNoteWiderThanScreen_clampsToLeftEdge()
    {
        const ui::WindowDimension screen{.height = 600, .width = 400};
        PositionAllocator allocator(PlacementSettings{});

        allocator.next_position(screen, NOTE);
        const auto second = allocator.next_position(
            screen, ui::WindowDimension{.height = 50, .width = 500});
        QCOMPARE(second.x, 0);
    }

    void rollback_returnsSlotToNextSurface()
    {
        PositionAllocator allocator(PlacementSettings{});

        const auto first = allocator.next_position(SCREEN, NOTE);
        const auto failed = allocator.next_position(SCREEN, NOTE);
        allocator.rollback();

        const auto retry = allocator.next_position(SCREEN, NOTE);
        QCOMPARE(retry, failed);
        QCOMPARE(retry.y, first.y + 60);
    }

    void rollback_onlyUndoesOneStep()
    {
        PositionAllocator allocator(PlacementSettings{});

        const auto first = allocator.next_position(SCREEN, NOTE);
        allocator.next_position(SCREEN, NOTE);
        allocator.rollback();
        allocator.rollback();

        // The first slot stays taken
        const auto next = allocator.next_position(SCREEN, NOTE);
        QCOMPARE(next.y, first.y + 60);
    }

    void rollback_ofFirstSlot_restartsAtAnchor()
    {
        PositionAllocator allocator(PlacementSettings{});

        const auto first = allocator.next_position(SCREEN, NOTE);
        allocator.rollback();
        QCOMPARE(allocator.next_position(SCREEN, NOTE), first);
    }
};

QTEST_GUILESS_MAIN(TestPositionAllocator)
#include "test_position_allocator.moc"
