#include <QCoreApplication>
#include <QDebug>
#include <QStringList>

#include "src/chunk_test.h"
#include "src/chunk_arena_test.h"
#include "src/chunked_queue_test.h"
#include "src/chunked_queue_bench.h"


int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);

    // QTest gets only the program name; our own flags stay here.
    const bool bench = app.arguments().contains(QStringLiteral("--bench"));
    int failed = 0;

    qDebug() << "\n" << "chunk test";
    failed += run_tst_chunk(1, argv);

    qDebug() << "\n" << "chunk_arena test";
    failed += run_tst_chunk_arena(1, argv);

    qDebug() << "\n" << "chunked_queue test";
    failed += run_tst_chunked_queue(1, argv);

    if (bench) {
        qDebug() << "\n" << "chunked_queue bench";
        failed += run_chunked_queue_bench();
    }

    if (failed != 0) {
        qWarning().noquote() << "\n[chunkq_tests]" << failed << "test function(s) or bench run(s) failed";
        return 1;
    }

    qInfo().noquote() << "\n[chunkq_tests] all suites passed";
    return 0;
}
