#include "D3D12Includes.h"

#include <spdlog/fmt/fmt.h>

namespace Helios::Graphics {

Error MakeDeviceError(std::string_view what, HRESULT hr) {
    ErrorCode code = ErrorCode::DeviceCall;
    if (hr == E_OUTOFMEMORY) {
        code = ErrorCode::OutOfMemory;
    } else if (IsDeviceRemovedError(hr)) {
        code = ErrorCode::DeviceRemoved;
    } else if (hr == E_INVALIDARG) {
        code = ErrorCode::InvalidArgument;
    }
    return Error(code, fmt::format("{} (hr=0x{:08X})", what, static_cast<unsigned int>(hr)));
}

void SetDebugName(ID3D12Object* object, std::string_view name) {
    if (!object || name.empty()) {
        return;
    }
    std::wstring wide(name.begin(), name.end());
    object->SetName(wide.c_str());
}

} // namespace Helios::Graphics
