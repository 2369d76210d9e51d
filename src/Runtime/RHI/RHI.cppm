export module RHI;

export import :Types;
export import :Backend;
export import :Commands;
export import :CommandQueue;
export import :Device;
export import :NullBackend;
