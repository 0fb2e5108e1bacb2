// chunked_queue_debug.h
// QDebug summary of a chunked_queue: "chunked_queue{fill/chunk_size}".
// Reads both cursors, so it is advisory while both sides are running.

#ifndef CHUNKED_QUEUE_DEBUG_H
#define CHUNKED_QUEUE_DEBUG_H

#include <QDebug>

#include "chunked_queue.hpp"

namespace chunkq {

template <class T, typename Policy, typename Alloc>
QDebug operator<<(QDebug dbg, const chunked_queue<T, Policy, Alloc>& q)
{
    QDebugStateSaver saver(dbg);
    dbg.nospace() << "chunked_queue{"
                  << static_cast<qulonglong>(q.fill()) << '/'
                  << static_cast<qulonglong>(q.chunk_size()) << '}';
    return dbg;
}

} // namespace chunkq

#endif // CHUNKED_QUEUE_DEBUG_H
