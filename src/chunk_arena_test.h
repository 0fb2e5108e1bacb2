#ifndef CHUNK_ARENA_TEST_H
#define CHUNK_ARENA_TEST_H

int run_tst_chunk_arena(int argc, char** argv);

#endif // CHUNK_ARENA_TEST_H
