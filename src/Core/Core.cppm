export module Core;

export import Core.Error;
export import Core.Logging;
export import Core.IOBackend;
