//
//  adapter_abi.h
//  CapturePush
//
//  C interface exported by institution adapter modules. A module is a
//  shared object built against this header; the PluginRegistry loads it
//  with dlopen(RTLD_NOW | RTLD_LOCAL) and resolves every function below.
//  Strings returned through `out_json` are owned by the module and must be
//  released with capturepush_free.
//

#ifndef CAPTUREPUSH_ADAPTER_ABI_H
#define CAPTUREPUSH_ADAPTER_ABI_H

#ifdef __cplusplus
extern "C" {
#endif

#define CAPTUREPUSH_ADAPTER_ABI_VERSION 1

// Return codes of the fetch functions. On an error `out_json` may hold a
// human readable message instead of a JSON array.
#define CAPTUREPUSH_OK                  0
#define CAPTUREPUSH_ERROR_RETRYABLE     1   // network trouble, try again later
#define CAPTUREPUSH_ERROR_FATAL         2   // bad credentials, unsupported account

int capturepush_abi_version(void);

const char* capturepush_school_name(void);

// On success returns CAPTUREPUSH_OK and stores a JSON array of records in
// *out_json. An empty array means the institution reported no records.
int capturepush_fetch_grades(const char* username, const char* password, int force_update, char** out_json);
int capturepush_fetch_course_schedule(const char* username, const char* password, int force_update, char** out_json);

void capturepush_free(char* ptr);

#ifdef __cplusplus
}
#endif

#endif // CAPTUREPUSH_ADAPTER_ABI_H
