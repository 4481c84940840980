#pragma once

#include <cstdlib>
#include <cstring>
#include <new>
#include <string>

namespace ws {

/// Default allocation policy for strings handed to the C API: malloc/free,
/// so a buffer is released with the same allocator that produced it.
struct HeapStringAllocator {
    static char* duplicate(const std::string& value) {
        char* p = static_cast<char*>(std::malloc(value.size() + 1));
        if (!p) {
            throw std::bad_alloc();
        }
        std::memcpy(p, value.c_str(), value.size() + 1);
        return p;
    }

    static void release(char* p) noexcept {
        std::free(p);
    }
};

/// Owns the heap buffer behind one `const char*` field of a native struct.
///
/// The native struct only stores the pointer.  This object is the sole owner
/// of that buffer: replacing the value installs the new buffer into the field
/// first and frees the old one afterwards, and destruction frees whatever is
/// still installed.  Non-copyable; the owner of the struct re-assigns from
/// the source value when it is copied.
template <typename Allocator = HeapStringAllocator>
class OwnedCString {
public:
    OwnedCString() = default;
    ~OwnedCString() { reset(); }

    OwnedCString(const OwnedCString&) = delete;
    OwnedCString& operator=(const OwnedCString&) = delete;

    /// Duplicate `value`, point `slot` at the copy, then free the buffer this
    /// object previously owned.
    void assign(const char*& slot, const std::string& value) {
        char* fresh = Allocator::duplicate(value);
        char* previous = ptr_;
        slot = fresh;
        ptr_ = fresh;
        if (previous) {
            Allocator::release(previous);
        }
    }

    /// Free the owned buffer.  The caller must already have pointed the
    /// native field elsewhere.
    void reset() noexcept {
        if (ptr_) {
            Allocator::release(ptr_);
            ptr_ = nullptr;
        }
    }

    const char* get() const { return ptr_; }

    /// Whether `slot` still points at the buffer this object owns.
    bool installed_in(const char* slot) const { return ptr_ && slot == ptr_; }

private:
    char* ptr_ = nullptr;
};

} // namespace ws
