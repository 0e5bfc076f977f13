export module Exchange;

export import :StepWriter;
export import :StepUnits;
export import :StepExporter;
export import :ObjReader;
