/* log.h - Leveled logging with named categories
 *
 * The log_* functions write to the default category, clog_* to a named one.
 * Each line is "[LEVEL] message", optionally prefixed by a timestamp. Output
 * goes to stderr unless redirected by log_set_output() or the config file.
 *
 * Config file format, one "key = value" per line, '#' starts a comment:
 *   level = debug | info | notice | warn | error | fatal
 *   output = stdout | stderr | <path>
 *   timestamps = 0 | 1
 *   <category>.level = <level>
 */
#ifndef QUIRE_LOG_H
#define QUIRE_LOG_H

#include <stdint.h>
#include <stddef.h>
#include <stdio.h>
#include <stdarg.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Return codes */
#define LOG_OK                  0
#define LOG_WRONG_FORMAT       -3
#define LOG_WRITE_FAIL         -4
#define LOG_INIT_FAIL          -5
#define LOG_CATEGORY_NOT_FOUND -6

typedef enum {
    LOG_LEVEL_DEBUG = 20,
    LOG_LEVEL_INFO = 40,
    LOG_LEVEL_NOTICE = 60,
    LOG_LEVEL_WARN = 80,
    LOG_LEVEL_ERROR = 100,
    LOG_LEVEL_FATAL = 120
} log_level;

#define LOG_MAX_CATEGORIES 16

typedef struct log_category_s {
    char name[64];
    int level;          /* messages below this level are dropped */
    FILE *output;       /* NULL = stderr */
    int enabled;
} log_category_t;

extern log_category_t *log_default_category;

/* A missing config file is not an error; the defaults stay in effect */
int log_init(const char *config);
void log_fini(void);

/* Find or create a category. NULL once LOG_MAX_CATEGORIES exist. */
log_category_t* log_get_category(const char *cname);

int clog_error(log_category_t *category, const char *format, ...);
int clog_warn(log_category_t *category, const char *format, ...);
int clog_info(log_category_t *category, const char *format, ...);
int clog_debug(log_category_t *category, const char *format, ...);

int log_fatal(const char *format, ...);
int log_error(const char *format, ...);
int log_warn(const char *format, ...);
int log_notice(const char *format, ...);
int log_info(const char *format, ...);
int log_debug(const char *format, ...);

/* A NULL category means the default category */
int log_level_enabled(log_category_t *category, const int level);
void log_set_level(log_category_t *category, int level);
void log_set_output(log_category_t *category, FILE *output);

void log_enable_timestamps(int enable);
const char* log_level_to_string(int level);
int log_level_from_string(const char *name);

/* Apply config text. Every line is applied; the last failure is returned. */
int log_parse_config_file(const char *filename);
int log_parse_config_string(const char *config);

#ifdef __cplusplus
}
#endif

#endif /* QUIRE_LOG_H */
