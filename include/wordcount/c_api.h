/*
 * wordcount/c_api.h — Guest ABI exported to the host pipeline engine.
 *
 * The host loads the module, exchanges bytes through the module's linear
 * memory, and drives the three pipeline phases through these five exports.
 *
 * OWNERSHIP CONTRACT:
 *   - The host may only write into memory whose address it received from
 *     wordcount_alloc(), and must release it with wordcount_dealloc() passing
 *     the SAME size. Mismatched sizes are refused and the block stays live.
 *   - After wordcount_dealloc() the address is invalid and must not be passed
 *     to wordcount_dealloc() again. Double release is not detected.
 *   - Output buffers passed to wordcount_metadata()/wordcount_call() are owned
 *     by the host for the duration of the call only.
 *
 * TRUNCATION CONTRACT:
 *   - Every call that writes into a caller buffer returns the TRUE encoded
 *     size, writes at most `capacity` bytes, and never NUL-terminates.
 *   - result > capacity means the output was truncated: allocate a buffer of
 *     `result` bytes and call again. Passing out=NULL queries the size.
 *
 * ERROR MODEL:
 *   - wordcount_call() never fails at the ABI level. Bad encoding, malformed
 *     requests, unknown functions and missing inputs all come back as a JSON
 *     Response with "success":false and an "error" string.
 *   - The only fatal condition is allocator exhaustion, which aborts.
 *
 * THREAD SAFETY:
 *   - No call keeps state between invocations. Separate module instances
 *     share nothing.
 *
 * WEBASSEMBLY:
 *   - When compiled for wasm32 the functions are also exported under the
 *     host's names: alloc, dealloc, metadata, call, abi_version.
 *
 * EXAMPLE (C, native):
 *   size_t need = wordcount_call(req, req_len, NULL, 0);
 *   uint8_t* out = wordcount_alloc(need);
 *   wordcount_call(req, req_len, out, need);
 *   ... parse out[0..need) ...
 *   wordcount_dealloc(out, need);
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#if defined(__wasm__)
#define WORDCOUNT_EXPORT(name) __attribute__((export_name(name), visibility("default")))
#elif defined(__GNUC__)
#define WORDCOUNT_EXPORT(name) __attribute__((visibility("default")))
#else
#define WORDCOUNT_EXPORT(name)
#endif

#ifdef __cplusplus
extern "C" {
#endif

/* Current guest ABI version. Bump on any breaking change. */
#define WORDCOUNT_ABI_VERSION 1

/*
 * wordcount_alloc — Reserve `size` bytes of guest memory (uninitialized).
 * Never returns NULL; aborts on exhaustion.
 */
WORDCOUNT_EXPORT("alloc") uint8_t* wordcount_alloc(size_t size);

/*
 * wordcount_dealloc — Release a block from wordcount_alloc().
 * `size` must equal the allocation size. NULL is a no-op.
 */
WORDCOUNT_EXPORT("dealloc") void wordcount_dealloc(uint8_t* ptr, size_t size);

/*
 * wordcount_metadata — Write the capability descriptor JSON into out.
 * Returns the true descriptor length (see TRUNCATION CONTRACT).
 */
WORDCOUNT_EXPORT("metadata") size_t wordcount_metadata(uint8_t* out, size_t capacity);

/*
 * wordcount_call — Run one pipeline phase.
 *
 * in/in_len: UTF-8 JSON Request {"node","function","config"?,"input"?}.
 * out/capacity: destination for the JSON Response.
 * Returns the true Response length (see TRUNCATION CONTRACT).
 */
WORDCOUNT_EXPORT("call") size_t wordcount_call(const uint8_t* in, size_t in_len, uint8_t* out, size_t capacity);

/* wordcount_abi_version — Return the compiled ABI version. */
WORDCOUNT_EXPORT("abi_version") uint32_t wordcount_abi_version(void);

#ifdef __cplusplus
}  /* extern "C" */
#endif
