#ifndef CHUNKED_QUEUE_TEST_H
#define CHUNKED_QUEUE_TEST_H

int run_tst_chunked_queue(int argc, char** argv);

#endif // CHUNKED_QUEUE_TEST_H
