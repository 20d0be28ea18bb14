// SPDX-License-Identifier: MIT
/**
 * @file vanilla_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the vanilla library
 *
 * Probes compile to single NOP instructions until a tracer attaches, so
 * they are safe to leave in the batch kernels.
 *
 * Probes live in whichever binary links the library. With the default
 * static build that is the executable; configure with
 * -DBUILD_SHARED_LIBS=ON to attach to libvanilla.so instead.
 *
 * Example usage with bpftrace (static build, benchmark binary):
 *   # Every rejected batch, with module, error code, value and index
 *   sudo bpftrace -e 'usdt:./vanilla_batch_benchmark:vanilla:validation_error {
 *       printf("module=%d code=%d index=%d\n", arg0, arg1, arg3); }'
 *
 *   # Batch sizes flowing through the pricing kernel
 *   sudo bpftrace -e 'usdt:./vanilla_batch_benchmark:vanilla:batch_start { @[arg0] = hist(arg1); }'
 */

#ifndef VANILLA_TRACE_H
#define VANILLA_TRACE_H

#include <stddef.h>

/**
 * On Linux with systemtap-sdt-dev installed, use sys/sdt.h.
 * Otherwise the probes expand to nothing.
 */
#ifdef HAVE_SYSTEMTAP_SDT
#include <sys/sdt.h>
#else
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#endif

/**
 * Provider name for all vanilla library probes
 */
#define VANILLA_PROVIDER vanilla

/**
 * Module identifiers, passed as the first argument of every probe
 */
#define VANILLA_MODULE_INPUTS       1
#define VANILLA_MODULE_NORMALIZER   2
#define VANILLA_MODULE_TERMS        3
#define VANILLA_MODULE_PRICING      4
#define VANILLA_MODULE_GREEKS       5

/**
 * ============================================================================
 * Batch Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when a module starts work on a batch
 * @param module_id: Module identifier (VANILLA_MODULE_* constant)
 * @param batch_size: Number of option instances in the batch
 * @param selector: Module-specific selector (Greek index, option type, or 0)
 */
#define VANILLA_TRACE_BATCH_START(module_id, batch_size, selector) \
    DTRACE_PROBE3(VANILLA_PROVIDER, batch_start, module_id, batch_size, selector)

/**
 * Fired when a module finishes a batch
 * @param module_id: Module identifier
 * @param batch_size: Number of results produced
 */
#define VANILLA_TRACE_BATCH_COMPLETE(module_id, batch_size) \
    DTRACE_PROBE2(VANILLA_PROVIDER, batch_complete, module_id, batch_size)

/**
 * ============================================================================
 * Validation and Error Probes
 * ============================================================================
 */

/**
 * Fired when input validation rejects a batch
 * @param module_id: Module identifier
 * @param error_code: PricingErrorCode as integer
 * @param value: Offending value (0.0 if not applicable)
 * @param index: Offending element or field index
 */
#define VANILLA_TRACE_VALIDATION_ERROR(module_id, error_code, value, index) \
    DTRACE_PROBE4(VANILLA_PROVIDER, validation_error, module_id, error_code, value, index)

/**
 * Fired when a batch is rejected for zero or non-finite total volatility
 * @param module_id: Module identifier
 * @param index: First degenerate element
 * @param sqrt_var: volatility * sqrt(expiry) at that element
 */
#define VANILLA_TRACE_DEGENERATE_VARIANCE(module_id, index, sqrt_var) \
    DTRACE_PROBE3(VANILLA_PROVIDER, degenerate_variance, module_id, index, sqrt_var)

#endif // VANILLA_TRACE_H
