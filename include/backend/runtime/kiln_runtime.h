#ifndef KILN_RUNTIME_H
#define KILN_RUNTIME_H

#include <stdint.h>

/*
 * C ABI used by generated code. Every value crosses this boundary as an
 * int64_t: integers as-is, strings and objects as addresses, unit as 0.
 */

#ifdef __cplusplus
extern "C" {
#endif

// frames
int64_t kiln_rt_enter(int64_t frame_name);
int64_t kiln_rt_leave(void);

// modules and objects
int64_t kiln_rt_init_module(int64_t init_fn, int64_t state);
int64_t kiln_rt_alloc(int64_t slots, int64_t class_name);

// strings
int64_t kiln_rt_concat(int64_t lhs, int64_t rhs);
int64_t kiln_rt_str_eq(int64_t lhs, int64_t rhs);
int64_t kiln_rt_int_to_str(int64_t value);
int64_t kiln_rt_show_int(int64_t value);
int64_t kiln_rt_show_str(int64_t value);
int64_t kiln_rt_show_obj(int64_t object);

// arithmetic
int64_t kiln_rt_div(int64_t lhs, int64_t rhs);
int64_t kiln_rt_mod(int64_t lhs, int64_t rhs);

// bridge
int64_t kiln_rt_exit(void);
int64_t kiln_rt_fail(int64_t message);
int64_t kiln_rt_println(int64_t text);

#ifdef __cplusplus
}
#endif

#endif // KILN_RUNTIME_H
