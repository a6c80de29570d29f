#ifndef H_CHUNKSTORE_TYPES_V0
#define H_CHUNKSTORE_TYPES_V0

#ifdef __cplusplus
extern "C"
{
#endif

    typedef enum
    {
        ChunkStoreLogLevel_Debug,
        ChunkStoreLogLevel_Info,
        ChunkStoreLogLevel_Warning,
        ChunkStoreLogLevel_Error,
        ChunkStoreLogLevel_None,
        ChunkStoreLogLevelCount
    } ChunkStoreLogLevel;

#ifdef __cplusplus
}
#endif

#endif // H_CHUNKSTORE_TYPES_V0
