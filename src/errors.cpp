#include "chunkstore.hh"

void
chunkstore::raise_error(ErrorKind kind, const std::string& message)
{
    switch (kind) {
        case ErrorKind::ChunkNotFound:
            throw ChunkNotFound(message);
        case ErrorKind::BadChunk:
            throw BadChunk(message);
        case ErrorKind::AuthorisationFailed:
            throw AuthorisationFailed(message);
        case ErrorKind::StoreUnavailable:
        default:
            throw StoreUnavailable(message);
    }
}
