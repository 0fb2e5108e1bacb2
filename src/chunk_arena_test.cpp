// chunk_arena_test.cpp
// Contract test for chunkq::chunk_arena.
//
// Goals:
//  - Ids are dense and handed out in order.
//  - Record addresses never move when later segments are added.
//  - Segments double in size and are allocated lazily.
//  - Destruction releases chunk storage (and the values in it), then segments.
//  - A null-returning allocator makes create() report npos_chunk cleanly.

#include <QtTest/QtTest>

#include <cstdint>
#include <cstdlib>
#include <new>
#include <vector>

#include "chunk_arena.hpp"
#include "chunk_arena_test.h"
#include "chunkq_test_support.h"

using namespace chunkq_test;

namespace {

using Arena        = chunkq::chunk_arena<std::uint32_t, NullAlloc>;
using TrackedArena = chunkq::chunk_arena<Tracked, NullAlloc>;

class tst_chunk_arena : public QObject {
    Q_OBJECT

private slots:
    void init() {
        tracked_reset();
        AllocStats::reset();
        AllocBudget::unlimited();
    }

    void cleanup() {
        AllocBudget::unlimited();
    }

    void starts_empty() {
        {
            Arena a;
            QCOMPARE(a.size(), chunkq::reg{0});
            QCOMPARE(a.segments(), chunkq::reg{0});
        }
        QCOMPARE(AllocStats::allocs.load(), std::size_t{0});
    }

    void ids_are_dense() {
        Arena a;
        for (chunkq::chunk_id i = 0; i < 100u; ++i) {
            QCOMPARE(a.create(), i);
        }
        QCOMPARE(a.size(), chunkq::reg{100});
    }

    void segments_double() {
        QCOMPARE(Arena::segment_size(0), chunkq::reg{8});
        QCOMPARE(Arena::segment_size(1), chunkq::reg{16});
        QCOMPARE(Arena::segment_size(2), chunkq::reg{32});

        Arena a;
        (void)a.create();
        QCOMPARE(a.segments(), chunkq::reg{1});
        QCOMPARE(AllocStats::allocs.load(), std::size_t{1});

        for (int i = 1; i < 8; ++i) {
            (void)a.create();
        }
        QCOMPARE(a.segments(), chunkq::reg{1});

        (void)a.create(); // id 8 opens segment 1
        QCOMPARE(a.segments(), chunkq::reg{2});

        for (int i = 9; i < 24; ++i) {
            (void)a.create();
        }
        QCOMPARE(a.segments(), chunkq::reg{2});

        (void)a.create(); // id 24 opens segment 2
        QCOMPARE(a.segments(), chunkq::reg{3});
        QCOMPARE(AllocStats::allocs.load(), std::size_t{3});
    }

    void addresses_are_stable() {
        Arena a;
        std::vector<const void*> addr;
        for (int i = 0; i < 200; ++i) {
            const chunkq::chunk_id id = a.create();
            QVERIFY(id != chunkq::npos_chunk);
            addr.push_back(&a[id]);
        }
        for (chunkq::chunk_id id = 0; id < 200u; ++id) {
            QCOMPARE(static_cast<const void*>(&a[id]), addr[id]);
        }
    }

    void records_are_independent() {
        Arena a;
        for (int i = 0; i < 40; ++i) {
            (void)a.create();
        }
        for (chunkq::chunk_id id = 0; id < 40u; ++id) {
            QVERIFY(!a[id].has_storage());
            a[id].set_next(id + 1u);
            a[id].set_prev(id == 0u ? chunkq::npos_chunk : id - 1u);
        }
        for (chunkq::chunk_id id = 0; id < 40u; ++id) {
            QCOMPARE(a[id].next(), chunkq::chunk_id{id + 1u});
        }
        QCOMPARE(a[0].prev(), chunkq::npos_chunk);
        QCOMPARE(a[39].prev(), chunkq::chunk_id{38});
    }

    void destructor_releases_storage() {
        {
            TrackedArena a;
            for (int i = 0; i < 20; ++i) {
                const chunkq::chunk_id id = a.create();
                QVERIFY(a[id].allocate(4u));
                a[id].stamp(static_cast<chunkq::pos_type>(id) * 4u);
                // Half the records keep values alive until the arena dies.
                if ((id & 1u) == 0u) {
                    (void)a[id].slot(0).emplace(id);
                    (void)a[id].slot(3).emplace(id + 1000u);
                }
            }
            // One record goes back to "dead" early.
            a[5].release();
            QCOMPARE(Tracked::live.load(), 20);
        }
        QCOMPARE(Tracked::live.load(), 0);
        QCOMPARE(Tracked::ctor.load(), Tracked::dtor.load());
        QCOMPARE(AllocStats::allocs.load(), AllocStats::deallocs.load());
        QCOMPARE(AllocStats::bytes_live.load(), std::size_t{0});
    }

    void create_reports_segment_failure() {
        Arena a;
        for (int i = 0; i < 8; ++i) {
            QVERIFY(a.create() != chunkq::npos_chunk);
        }

        AllocBudget::set(0);
        QCOMPARE(a.create(), chunkq::npos_chunk);
        QCOMPARE(a.size(), chunkq::reg{8});
        QCOMPARE(a.segments(), chunkq::reg{1});

        AllocBudget::unlimited();
        QCOMPARE(a.create(), chunkq::chunk_id{8});
        QCOMPARE(a.segments(), chunkq::reg{2});
    }

    void create_inside_segment_needs_no_allocation() {
        Arena a;
        (void)a.create();
        AllocBudget::set(0);
        for (int i = 1; i < 8; ++i) {
            QVERIFY(a.create() != chunkq::npos_chunk);
        }
        QCOMPARE(a.size(), chunkq::reg{8});
    }
};

} // namespace

int run_tst_chunk_arena(int argc, char** argv) {
    tst_chunk_arena tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "chunk_arena_test.moc"
