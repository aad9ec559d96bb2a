#pragma once

// Build-time platform constants. Every value can be overridden from the
// build (-DKHEAP_HEAP_SIZE=...), which is how a board port selects its
// memory map.

// Where the kernel image is loaded. The boot stack grows down from here.
#ifndef KHEAP_KERNEL_START
#define KHEAP_KERNEL_START 0x80000UL
#endif

#ifndef KHEAP_KERNEL_STACK_START
#define KHEAP_KERNEL_STACK_START KHEAP_KERNEL_START
#endif

// The heap sits 2MiB above the stack top so it never overlaps the kernel
// image, the stack, or the peripheral window.
#ifndef KHEAP_HEAP_START
#define KHEAP_HEAP_START (KHEAP_KERNEL_STACK_START + 0x200000UL)
#endif

#ifndef KHEAP_HEAP_SIZE
#define KHEAP_HEAP_SIZE 0x200000UL
#endif

// Granularity of every block start and size. Must be a power of two and
// at least the width of a machine word.
#ifndef KHEAP_ALIGNMENT
#define KHEAP_ALIGNMENT 8
#endif

// 0 = first fit, 1 = best fit, 2 = worst fit, 3 = next fit
#ifndef KHEAP_DEFAULT_STRATEGY
#define KHEAP_DEFAULT_STRATEGY 1
#endif
