#ifndef CHUNKED_QUEUE_BENCH_H
#define CHUNKED_QUEUE_BENCH_H

// Number of MT runs that timed out.
int run_chunked_queue_bench();

#endif // CHUNKED_QUEUE_BENCH_H
