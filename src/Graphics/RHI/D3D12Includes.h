#pragma once

// Prefer the Windows SDK headers; fall back to the DirectX-Headers package
// layout where the SDK include path is not present.

#if __has_include(<d3d12.h>)
#include <d3d12.h>
#elif __has_include(<directx/d3d12.h>)
#include <directx/d3d12.h>
#else
#error "Neither <d3d12.h> nor <directx/d3d12.h> could be found. Install the Windows SDK or DirectX-Headers."
#endif

#include <dxgi1_6.h>
#include <wrl/client.h>

#include <string>
#include <string_view>

#include "Utils/Result.h"

using Microsoft::WRL::ComPtr;

namespace Helios::Graphics {

// Maps a failed HRESULT to an Error whose message reads "<what> (hr=0x...)".
[[nodiscard]] Error MakeDeviceError(std::string_view what, HRESULT hr);

[[nodiscard]] inline bool IsDeviceRemovedError(HRESULT hr) {
    return hr == DXGI_ERROR_DEVICE_REMOVED || hr == DXGI_ERROR_DEVICE_RESET || hr == DXGI_ERROR_DEVICE_HUNG;
}

// Debug names show up in PIX captures and validation messages.
void SetDebugName(ID3D12Object* object, std::string_view name);

} // namespace Helios::Graphics
