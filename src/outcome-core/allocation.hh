#pragma once

#include <outcome-core/assert.hh>
#include <outcome-core/fwd.hh>
#include <outcome-core/utility.hh>

#include <cstddef>
#include <memory>
#include <type_traits>

// Heap storage for the payloads of type-erased wrappers (oc::throwing and everything built on it).
//
// Memory comes from a oc::memory_resource: a POD of function pointers, usable during static initialization.
// oc::any_allocation owns exactly one object in such memory and knows how to destroy it and give the bytes back,
// without remembering the object's type.
//
// Usage:
//   auto a = oc::any_allocation::create_from<my_callable>(*oc::default_memory_resource, args...);
//   invoke(*static_cast<my_callable*>(a.ptr));
//   // a's destructor runs ~my_callable() and deallocates

namespace oc
{
/// System-backed resource stored in the data segment
/// Valid during static initialization in other translation units
extern oc::memory_resource const* const default_memory_resource;
} // namespace oc

/// Polymorphic memory resource interface
/// Function pointers instead of virtual dispatch keep this a constinit-able POD
struct oc::memory_resource
{
    /// Returns at least `bytes` bytes aligned to `alignment` (a power of two)
    /// Throws std::bad_alloc when no memory is available. bytes == 0 returns nullptr.
    oc::function_ptr<std::byte*(isize bytes, isize alignment, void* userdata)> allocate_bytes = nullptr;

    /// p must come from allocate_bytes of the same resource with the same bytes and alignment
    oc::function_ptr<void(std::byte* p, isize bytes, isize alignment, void* userdata)> deallocate_bytes = nullptr;

    /// User-defined data for stateful resources, nullptr for the system resource
    void* userdata = nullptr;
};

/// Move-only owning handle for a single type-erased object stored in memory_resource memory
/// Remembers the destructor and the byte layout, so destruction needs no type information
struct oc::any_allocation
{
    // properties
public:
    [[nodiscard]] bool is_valid() const { return ptr != nullptr; }
    explicit operator bool() const { return ptr != nullptr; }

    // factory
public:
    /// Allocates from resource and constructs a T in place
    /// If the constructor throws, the bytes are returned to the resource and the exception propagates
    template <class T, class... Args>
    [[nodiscard]] static any_allocation create_from(memory_resource const& resource, Args&&... args)
    {
        static_assert(std::is_constructible_v<T, Args...>, "T is not constructible from the provided argument types");

        any_allocation a;
        a.resource = &resource;
        a.bytes = isize(sizeof(T));
        a.alignment = isize(alignof(T));
        a.ptr = resource.allocate_bytes(a.bytes, a.alignment, resource.userdata);
        OC_ASSERT(a.ptr != nullptr, "memory resource returned null for a non-empty allocation");

        // no deleter yet: a failing constructor only deallocates
        std::construct_at(static_cast<T*>(a.ptr), oc::forward<Args>(args)...);
        if constexpr (!std::is_trivially_destructible_v<T>)
            a.deleter = [](void* p) { std::destroy_at(static_cast<T*>(p)); };
        return a;
    }

    // ctors/dtor
public:
    any_allocation() = default;

    any_allocation(any_allocation&& rhs) noexcept
      : ptr(rhs.ptr), deleter(rhs.deleter), resource(rhs.resource), bytes(rhs.bytes), alignment(rhs.alignment)
    {
        rhs.ptr = nullptr;
        rhs.deleter = nullptr;
    }
    any_allocation& operator=(any_allocation&& rhs) noexcept
    {
        if (this != &rhs)
        {
            release();
            ptr = rhs.ptr;
            deleter = rhs.deleter;
            resource = rhs.resource;
            bytes = rhs.bytes;
            alignment = rhs.alignment;
            rhs.ptr = nullptr;
            rhs.deleter = nullptr;
        }
        return *this;
    }
    any_allocation(any_allocation const&) = delete;
    any_allocation& operator=(any_allocation const&) = delete;

    ~any_allocation() { release(); }

private:
    void release()
    {
        if (ptr == nullptr)
            return;

        if (deleter)
            deleter(ptr);
        resource->deallocate_bytes(static_cast<std::byte*>(ptr), bytes, alignment, resource->userdata);
        ptr = nullptr;
        deleter = nullptr;
    }

    // members
public:
    /// The managed object, nullptr for an empty handle
    void* ptr = nullptr;

    /// Runs the destructor of *ptr, null for trivially destructible objects
    oc::function_ptr<void(void*)> deleter = nullptr;

    memory_resource const* resource = nullptr;
    isize bytes = 0;
    isize alignment = 0;
};
