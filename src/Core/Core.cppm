export module Core;

// Re-export all sub-systems so the user only needs 'import Core;'
export import :Error;
export import :Logging;
export import :Assert;
export import :Handle;
export import :Memory;
export import :SlotPool;
export import :Window;
