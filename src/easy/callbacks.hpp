#ifndef CURLBIND_CALLBACKS_HPP
#define CURLBIND_CALLBACKS_HPP

#include <cstddef>

namespace curlbind::easy::callbacks {
    // Trampolines installed by Handle::perform as READFUNCTION, WRITEFUNCTION and HEADERFUNCTION. `userdata`
    // is a ContextRegistry token, never a real pointer; a null token means there is nothing to do.

    // Returns bytes read, 0 at end of stream, CURL_READFUNC_ABORT when the body source fails.
    size_t read_callback(char* buffer, size_t size, size_t n_items, void* userdata);

    size_t write_callback(char* buffer, size_t size, size_t n_items, void* userdata);

    size_t header_callback(char* buffer, size_t size, size_t n_items, void* userdata);
}  // namespace curlbind::easy::callbacks

#endif
