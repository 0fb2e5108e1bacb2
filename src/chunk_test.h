#ifndef CHUNK_TEST_H
#define CHUNK_TEST_H

int run_tst_chunk(int argc, char** argv);

#endif // CHUNK_TEST_H
