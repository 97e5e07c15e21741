#include "allocation.hh"

#include <outcome-core/macros.hh>

#include <cstdlib>
#include <new>

namespace
{
bool is_power_of_two(oc::isize v)
{
    return v > 0 && (v & (v - 1)) == 0;
}

std::byte* system_allocate_bytes(oc::isize bytes, oc::isize alignment, void* userdata)
{
    OC_UNUSED(userdata);

    OC_ASSERT(is_power_of_two(alignment), "alignment must be a power of 2");
    OC_ASSERT(bytes >= 0, "cannot allocate a negative number of bytes");

    if (bytes == 0)
        return nullptr;

    void* p = nullptr;
#ifdef OC_OS_WINDOWS
    p = _aligned_malloc(std::size_t(bytes), std::size_t(alignment));
#else
    // posix_memalign instead of std::aligned_alloc: no bytes % alignment == 0 requirement
    // posix_memalign requires alignment >= sizeof(void*)
    auto const effective_alignment = alignment < oc::isize(sizeof(void*)) ? oc::isize(sizeof(void*)) : alignment;
    if (posix_memalign(&p, std::size_t(effective_alignment), std::size_t(bytes)) != 0)
        p = nullptr;
#endif

    if (p == nullptr)
        throw std::bad_alloc();
    return static_cast<std::byte*>(p);
}

void system_deallocate_bytes(std::byte* p, oc::isize bytes, oc::isize alignment, void* userdata)
{
    OC_UNUSED(bytes);
    OC_UNUSED(alignment);
    OC_UNUSED(userdata);

    // must match the allocation function of the platform
#ifdef OC_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}

constinit oc::memory_resource const system_memory_resource = {
    .allocate_bytes = system_allocate_bytes,
    .deallocate_bytes = system_deallocate_bytes,
    .userdata = nullptr,
};
} // namespace

constinit oc::memory_resource const* const oc::default_memory_resource = &system_memory_resource;
