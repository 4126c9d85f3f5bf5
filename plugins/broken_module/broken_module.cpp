//
//  broken_module.cpp
//  CapturePush test fixture
//
//  Loads fine but does not export the fetch functions, so resolving it
//  must fail with a LoadException.
//

#include "capturepush/adapter_abi.h"

extern "C" {

int capturepush_abi_version(void) {
    return CAPTUREPUSH_ADAPTER_ABI_VERSION;
}

const char* capturepush_school_name(void) {
    return "Broken Adapter";
}

}
