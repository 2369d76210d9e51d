export module Graphics;

export import :InstanceData;
export import :TextureRegistry;
export import :Batcher;
