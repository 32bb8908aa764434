/**
 * port_traits.h
 * Port traits for the Linux procfs port backend.
 */
#ifndef PORT_TRAITS_H
#define PORT_TRAITS_H

#define BATON_PORT_LINUX 1

#define BATON_PORT_PROCFS_ROOT       "/proc/self/task"
#define BATON_PORT_PROCFS_LINE_MAX   512u   // Longest stat/syscall line we read

#endif
